#include <hotstring/engine.h>
#include <hotstring/hotstring.h>
#include "rule_set.h"
#include "case_format.h"
#include "../automaton/priority.h"
#include "../matching/state_manager.h"
#include "../utils/circular_buffer.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"
#include <algorithm>
#include <exception>

namespace hotstring {

namespace {

EndCharPredicate makeEndCharPredicate(const std::u32string& endCharacters) {
    if (endCharacters.empty()) {
        return [](char32_t ch) { return utils::isEndCharacter(ch); };
    }
    return [endCharacters](char32_t ch) {
        return endCharacters.find(ch) != std::u32string::npos;
    };
}

} // anonymous namespace

// Engine implementation
Engine::Engine(const Config& config)
    : config_(config)
    , buffer_(std::make_unique<utils::CircularBuffer<char32_t>>(config.historyDepth))
    , conflicts_(std::make_unique<ConflictLog>())
    , clock_([] { return std::chrono::steady_clock::now(); }) {
}

Engine::~Engine() = default;

Result Engine::setRules(const RuleTable& rules) {
    if (config_.historyDepth == 0) {
        utils::warningLog("history depth must be at least 1");
        return Result::ErrorInvalidParameter;
    }

    RuleList built;
    std::string error;
    Result result = RuleSetBuilder::build(rules, config_.defaults, built, error);
    if (result != Result::Success) {
        // The previous rule set stays active
        utils::warningLog("rejected rule table: " + error);
        diagnostics_.push_back(error);
        return result;
    }

    size_t longest = 0;
    for (const auto& rule : built) {
        longest = std::max(longest, rule->abbreviation.size());
    }

    auto conflicts = std::make_unique<ConflictLog>();
    std::unique_ptr<StateManager> stateManager;
    if (!built.empty()) {
        stateManager = std::make_unique<StateManager>(
            built, makeEndCharPredicate(config_.endCharacters), config_.historyDepth,
            config_.engineKind, conflicts.get());
    }

    rules_ = std::move(built);
    stateManager_ = std::move(stateManager);
    conflicts_ = std::move(conflicts);
    // Every undo step the walkers keep still has its character here
    buffer_ = std::make_unique<utils::CircularBuffer<char32_t>>(
        config_.historyDepth + longest + 1);
    diagnostics_ = conflicts_->messages();
    lastActivity_.reset();

    utils::debugLog("Loaded " + std::to_string(rules_.size()) + " rules");
    return Result::Success;
}

void Engine::clearRules() {
    rules_.clear();
    stateManager_.reset();
    conflicts_->clear();
    diagnostics_.clear();
    resetSession();
}

bool Engine::hasRules() const {
    return !rules_.empty();
}

size_t Engine::getRuleCount() const {
    return rules_.size();
}

std::optional<ResolvedExpansion> Engine::handleCharacter(char32_t ch) {
    expireIfIdle();
    touch();

    buffer_->push(ch);
    if (!stateManager_) {
        return std::nullopt;
    }

    const Rule* matched = stateManager_->followEdge(ch);
    if (!matched) {
        return std::nullopt;
    }

    ResolvedExpansion expansion;
    expansion.rule = rules_[matched->id];
    const Rule& rule = *expansion.rule;

    size_t triggerLength = rule.abbreviation.size() + (rule.flags.waitForCompletionKey ? 1 : 0);
    auto typed = buffer_->getEnding(triggerLength);
    expansion.trigger.assign(typed.begin(), typed.end());

    std::string text;
    try {
        text = rule.evaluate();
    } catch (const std::exception& e) {
        std::string message = "output callback for \"" + utils::utf32ToUtf8(rule.abbreviation) +
                              "\" failed: " + e.what();
        utils::warningLog(message);
        diagnostics_.push_back(message);
        return std::nullopt;
    } catch (...) {
        std::string message = "output callback for \"" + utils::utf32ToUtf8(rule.abbreviation) +
                              "\" failed with an unknown error";
        utils::warningLog(message);
        diagnostics_.push_back(message);
        return std::nullopt;
    }

    std::u32string output;
    if (!utils::utf8ToUtf32(text, output)) {
        std::string message = "output for \"" + utils::utf32ToUtf8(rule.abbreviation) +
                              "\" is not valid UTF-8";
        utils::warningLog(message);
        diagnostics_.push_back(message);
        return std::nullopt;
    }

    if (rule.flags.matchCase && !rule.flags.caseSensitive) {
        std::u32string typedAbbreviation = expansion.trigger.substr(
            0, std::min(rule.abbreviation.size(), expansion.trigger.size()));
        output = matchCase(typedAbbreviation, output);
    }
    expansion.output = utils::utf32ToUtf8(output);
    expansion.deferred = !rule.flags.waitForCompletionKey &&
                         !rule.flags.backspace &&
                         rule.flags.sendCompletionKey;

    utils::debugLog("Matched \"" + utils::utf32ToUtf8(rule.abbreviation) + "\" -> \"" +
                    expansion.output + "\"");

    if (rule.flags.resetRecognizer) {
        resetSession();
    }
    return expansion;
}

void Engine::handleDelete() {
    expireIfIdle();
    touch();

    buffer_->pop();
    if (stateManager_) {
        stateManager_->rewind();
    }
}

void Engine::handleReset() {
    touch();
    resetSession();
}

void Engine::resetSession() {
    buffer_->clear();
    if (stateManager_) {
        stateManager_->reset();
    }
}

KeyAction Engine::classifyKey(const Input& input) {
    if (isModifierKey(input.keyCode)) {
        return KeyAction::Ignore;
    }
    if (input.modifiers.isShortcutChord()) {
        return KeyAction::Reset;
    }
    if (input.keyCode == VirtualKey::Back) {
        return KeyAction::Delete;
    }
    if (VirtualKeyHelper::isResetKey(input.keyCode)) {
        return KeyAction::Reset;
    }
    if (input.character != 0) {
        return KeyAction::Character;
    }
    switch (input.keyCode) {
        case VirtualKey::Space:
        case VirtualKey::Tab:
        case VirtualKey::Return:
            return KeyAction::Character;
        default:
            return KeyAction::Ignore;
    }
}

Output Engine::processKey(const Input& input) {
    switch (classifyKey(input)) {
        case KeyAction::Reset:
            handleReset();
            return Output::None();
        case KeyAction::Delete:
            handleDelete();
            return Output::None();
        case KeyAction::Ignore:
            return Output::None();
        case KeyAction::Character:
            break;
    }

    char32_t ch = input.character;
    if (ch == 0) {
        switch (input.keyCode) {
            case VirtualKey::Space: ch = U' '; break;
            case VirtualKey::Tab: ch = U'\t'; break;
            default: ch = U'\n'; break;
        }
    }

    auto expansion = handleCharacter(ch);
    if (!expansion) {
        return Output::None();
    }
    return planKeystrokes(*expansion);
}

Output Engine::planKeystrokes(const ResolvedExpansion& expansion) const {
    const RuleFlags& flags = expansion.rule->flags;

    // Typed key reaches the application, the expansion follows it
    if (expansion.deferred) {
        return Output::Deferred(expansion.output);
    }

    // The triggering key is consumed; everything before it is on screen
    int deleteCount = 0;
    if (flags.backspace && !expansion.trigger.empty()) {
        deleteCount = static_cast<int>(expansion.trigger.size()) - 1;
    }

    std::string text = expansion.output;
    if (flags.sendCompletionKey && !expansion.trigger.empty()) {
        text += utils::utf32ToUtf8(expansion.trigger.back());
    }
    return Output::DeleteAndInsert(deleteCount, text);
}

bool Engine::checkTimeout() {
    if (config_.timeoutSeconds <= 0 || !lastActivity_) {
        return false;
    }
    std::chrono::duration<double> idle = clock_() - *lastActivity_;
    if (idle.count() < config_.timeoutSeconds) {
        return false;
    }

    utils::debugLog("Timed out after " + std::to_string(idle.count()) + "s idle");
    lastActivity_.reset();
    resetSession();
    return true;
}

void Engine::setClock(Clock clock) {
    clock_ = clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); });
}

void Engine::expireIfIdle() {
    checkTimeout();
}

void Engine::touch() {
    lastActivity_ = clock_();
}

std::u32string Engine::getBuffer() const {
    auto chars = buffer_->getAll();
    return std::u32string(chars.begin(), chars.end());
}

std::string Engine::getBufferText() const {
    return utils::utf32ToUtf8(getBuffer());
}

std::string Engine::dumpAutomaton() const {
    return stateManager_ ? stateManager_->dump() : std::string();
}

// HotstringEngine implementation (public API)
HotstringEngine::HotstringEngine(const Config& config)
    : engine_(std::make_unique<Engine>(config)) {
}

HotstringEngine::~HotstringEngine() = default;

HotstringEngine::HotstringEngine(HotstringEngine&&) noexcept = default;
HotstringEngine& HotstringEngine::operator=(HotstringEngine&&) noexcept = default;

Result HotstringEngine::setRules(const RuleTable& rules) {
    return engine_->setRules(rules);
}

Output HotstringEngine::processKey(const Input& input) {
    return engine_->processKey(input);
}

Output HotstringEngine::processCharacter(char32_t character) {
    return engine_->processKey(Input::Character(character));
}

Output HotstringEngine::processWindowsKey(int vkCode, char32_t character, const Modifiers& modifiers) {
    Input input(VirtualKeyHelper::fromWindowsVK(vkCode), character, modifiers);
    return engine_->processKey(input);
}

void HotstringEngine::deleteCharacter() {
    engine_->handleDelete();
}

void HotstringEngine::reset() {
    engine_->handleReset();
}

bool HotstringEngine::checkTimeout() {
    return engine_->checkTimeout();
}

bool HotstringEngine::hasRules() const {
    return engine_->hasRules();
}

std::string HotstringEngine::getAbbreviation() const {
    return engine_->getBufferText();
}

std::vector<std::string> HotstringEngine::getDiagnostics() const {
    return engine_->getDiagnostics();
}

std::string HotstringEngine::getVersion() {
    return HOTSTRING_VERSION;
}

} // namespace hotstring
