#ifndef HOTSTRING_H
#define HOTSTRING_H

#ifdef __cplusplus
#include "types.h"
#include "rule.h"
#include "virtual_keys.h"
#include <memory>
#include <string>
#include <vector>
#endif

#include <stddef.h>
#include <stdint.h>

#define HOTSTRING_VERSION "1.0.0"

// Export/import macros for shared library
#ifdef _WIN32
    #ifdef HOTSTRING_CORE_EXPORTS
        #define HOTSTRING_API __declspec(dllexport)
    #elif defined(HOTSTRING_CORE_IMPORTS)
        #define HOTSTRING_API __declspec(dllimport)
    #else
        #define HOTSTRING_API
    #endif
#else
    #define HOTSTRING_API __attribute__((visibility("default")))
#endif

// C API compatibility - wrap in extern "C" when included from C++
#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle to the engine (for C API)
typedef struct HotstringEngineHandle HotstringEngineHandle;

// Result codes (C-compatible)
typedef enum {
    HotstringResult_Success = 0,
    HotstringResult_ErrorInvalidParameter = -1,
    HotstringResult_ErrorUtf8Conversion = -2,
    HotstringResult_ErrorInvalidRule = -3,
} HotstringResult;

// Action types (C-compatible)
typedef enum {
    HotstringAction_None = 0,
    HotstringAction_Insert = 1,
    HotstringAction_BackspaceDelete = 2,
    HotstringAction_BackspaceDeleteAndInsert = 3,
} HotstringAction;

// Matching backends (C-compatible)
typedef enum {
    HotstringEngineKind_Dfa = 0,
    HotstringEngineKind_Trie = 1,
} HotstringEngineKind;

// Returns the expansion as a UTF-8 string owned by the caller's code and
// valid until the next call, or NULL on failure (no expansion happens).
typedef const char* (*HotstringOutputCallback)(void* user_data);

// One abbreviation. Flags take -1 for "use the default", 0 or 1 otherwise.
typedef struct {
    const char* abbreviation;          // UTF-8, non-empty
    const char* text;                  // UTF-8 expansion; ignored when callback is set
    HotstringOutputCallback callback;
    void* user_data;
    int backspace;
    int case_sensitive;
    int internal;
    int match_case;
    int reset_recognizer;
    int send_completion_key;
    int wait_for_completion_key;
    int has_priority;                  // 0 = default priority
    int priority;
} HotstringRuleSpec;

// Keystroke plan from key processing (C-compatible)
typedef struct {
    int action_type;      // HotstringAction
    char* text;           // UTF-8 encoded, null-terminated (needs to be freed)
    int delete_count;     // Characters to erase before typing text
    int is_processed;     // 0 = pass the key through, 1 = key consumed
    int deferred;         // 1 = deliver the key first, then type text
} HotstringOutput;

// Engine management
HOTSTRING_API HotstringEngineHandle* hotstring_engine_new(void);
HOTSTRING_API HotstringEngineHandle* hotstring_engine_new_with_options(
    int engine_kind,              // HotstringEngineKind
    double timeout_seconds,       // <= 0 disables the idle timeout
    size_t history_depth
);
HOTSTRING_API void hotstring_engine_free(HotstringEngineHandle* handle);

// Rule loading; the previous rules stay active when this fails
HOTSTRING_API HotstringResult hotstring_engine_set_rules(
    HotstringEngineHandle* handle,
    const HotstringRuleSpec* rules,
    size_t rule_count
);

// Key processing
HOTSTRING_API HotstringResult hotstring_engine_process_char(
    HotstringEngineHandle* handle,
    uint32_t character,
    HotstringOutput* output
);

// Windows-style key processing with VK codes
HOTSTRING_API HotstringResult hotstring_engine_process_key_win(
    HotstringEngineHandle* handle,
    int vk_code,          // Windows VK code (e.g., 0x08 for VK_BACK)
    uint32_t character,
    int shift,
    int ctrl,
    int alt,
    int meta,
    HotstringOutput* output
);

// Engine control
HOTSTRING_API HotstringResult hotstring_engine_delete(HotstringEngineHandle* handle);
HOTSTRING_API HotstringResult hotstring_engine_reset(HotstringEngineHandle* handle);
HOTSTRING_API int hotstring_engine_check_timeout(HotstringEngineHandle* handle);
HOTSTRING_API char* hotstring_engine_get_abbreviation(HotstringEngineHandle* handle);

// Memory management
HOTSTRING_API void hotstring_free_string(char* s);
HOTSTRING_API void hotstring_free_output(HotstringOutput* output);

// Version info
HOTSTRING_API const char* hotstring_get_version(void);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================

#ifdef __cplusplus

namespace hotstring {

// Forward declarations
class Engine;

// Main engine class
class HOTSTRING_API HotstringEngine {
public:
    explicit HotstringEngine(const Config& config = Config());
    ~HotstringEngine();

    // Disable copy, enable move
    HotstringEngine(const HotstringEngine&) = delete;
    HotstringEngine& operator=(const HotstringEngine&) = delete;
    HotstringEngine(HotstringEngine&&) noexcept;
    HotstringEngine& operator=(HotstringEngine&&) noexcept;

    // Rule loading
    Result setRules(const RuleTable& rules);
    bool hasRules() const;

    // Key processing
    Output processKey(const Input& input);
    Output processCharacter(char32_t character);
    Output processWindowsKey(int vkCode, char32_t character, const Modifiers& modifiers);

    // Engine control
    void deleteCharacter();
    void reset();
    bool checkTimeout();

    // Text typed since the last reset (UTF-8)
    std::string getAbbreviation() const;
    std::vector<std::string> getDiagnostics() const;

    // Version
    static std::string getVersion();

private:
    std::unique_ptr<Engine> engine_;
};

} // namespace hotstring

#endif // __cplusplus

#endif // HOTSTRING_H
