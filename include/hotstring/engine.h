#ifndef HOTSTRING_ENGINE_H
#define HOTSTRING_ENGINE_H

#include "types.h"
#include "rule.h"
#include "virtual_keys.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hotstring {

// Forward declarations
class StateManager;
class ConflictLog;
namespace utils {
template <typename T> class CircularBuffer;
}

// A rule that fired, with everything the host needs to inject it
struct ResolvedExpansion {
    std::shared_ptr<const Rule> rule;
    std::u32string trigger;     // Typed text the rule replaces, completion key included
    std::string output;         // Expansion text (UTF-8), case already adapted
    bool deferred = false;      // Triggering key must reach the application first
};

// Recognition session for one keystroke stream (implementation detail)
class Engine {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit Engine(const Config& config = Config());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Rule management
    Result setRules(const RuleTable& rules);
    void clearRules();
    bool hasRules() const;
    size_t getRuleCount() const;

    // Stream events
    std::optional<ResolvedExpansion> handleCharacter(char32_t ch);
    void handleDelete();
    void handleReset();

    // Classifies a key event, drives the recognizer and plans keystrokes
    Output processKey(const Input& input);
    static KeyAction classifyKey(const Input& input);

    // Idle timeout
    bool checkTimeout();
    void setClock(Clock clock);

    // Introspection
    const Config& getConfig() const { return config_; }
    std::u32string getBuffer() const;
    std::string getBufferText() const;
    const std::vector<std::string>& getDiagnostics() const { return diagnostics_; }
    std::string dumpAutomaton() const;

private:
    Output planKeystrokes(const ResolvedExpansion& expansion) const;
    void resetSession();
    void expireIfIdle();
    void touch();

    // Members
    Config config_;
    RuleList rules_;
    std::unique_ptr<StateManager> stateManager_;
    std::unique_ptr<utils::CircularBuffer<char32_t>> buffer_;
    std::unique_ptr<ConflictLog> conflicts_;
    std::vector<std::string> diagnostics_;

    Clock clock_;
    std::optional<std::chrono::steady_clock::time_point> lastActivity_;
};

} // namespace hotstring

#endif // HOTSTRING_ENGINE_H
