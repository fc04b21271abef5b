#include <hotstring/hotstring.h>
#include <hotstring/engine.h>
#include "../utils/debug.h"
#include <cstring>
#include <stdexcept>

namespace {

// A handle is the engine it owns; each caller keeps its own sessions
hotstring::Engine* toEngine(HotstringEngineHandle* handle) {
    return reinterpret_cast<hotstring::Engine*>(handle);
}

HotstringEngineHandle* toHandle(std::unique_ptr<hotstring::Engine> engine) {
    return reinterpret_cast<HotstringEngineHandle*>(engine.release());
}

HotstringResult toCResult(hotstring::Result result) {
    return static_cast<HotstringResult>(static_cast<int>(result));
}

char* allocateAndCopyString(const std::string& str) {
    if (str.empty()) {
        return nullptr;
    }
    char* result = new char[str.length() + 1];
    std::strcpy(result, str.c_str());
    return result;
}

void fillOutput(const hotstring::Output& output, HotstringOutput* cOutput) {
    switch (output.action) {
        case hotstring::ActionType::None:
            cOutput->action_type = HotstringAction_None;
            break;
        case hotstring::ActionType::Insert:
            cOutput->action_type = HotstringAction_Insert;
            break;
        case hotstring::ActionType::BackspaceDelete:
            cOutput->action_type = HotstringAction_BackspaceDelete;
            break;
        case hotstring::ActionType::BackspaceDeleteAndInsert:
            cOutput->action_type = HotstringAction_BackspaceDeleteAndInsert;
            break;
    }

    cOutput->text = allocateAndCopyString(output.text);
    cOutput->delete_count = output.deleteCount;
    cOutput->is_processed = output.isProcessed ? 1 : 0;
    cOutput->deferred = output.deferred ? 1 : 0;
}

void applyFlag(int value, std::optional<bool>& flag) {
    if (value >= 0) {
        flag = value != 0;
    }
}

hotstring::RuleConfig toRuleConfig(const HotstringRuleSpec& spec) {
    hotstring::RuleConfig config;
    if (spec.callback) {
        HotstringOutputCallback callback = spec.callback;
        void* userData = spec.user_data;
        config.output = hotstring::OutputCallback([callback, userData]() {
            const char* text = callback(userData);
            if (!text) {
                throw std::runtime_error("callback returned no text");
            }
            return std::string(text);
        });
    } else {
        config.output = std::string(spec.text ? spec.text : "");
    }

    applyFlag(spec.backspace, config.options.backspace);
    applyFlag(spec.case_sensitive, config.options.caseSensitive);
    applyFlag(spec.internal, config.options.internal);
    applyFlag(spec.match_case, config.options.matchCase);
    applyFlag(spec.reset_recognizer, config.options.resetRecognizer);
    applyFlag(spec.send_completion_key, config.options.sendCompletionKey);
    applyFlag(spec.wait_for_completion_key, config.options.waitForCompletionKey);
    if (spec.has_priority) {
        config.options.priority = spec.priority;
    }
    return config;
}

} // anonymous namespace

extern "C" {

// Engine management
HOTSTRING_API HotstringEngineHandle* hotstring_engine_new(void) {
    return toHandle(std::make_unique<hotstring::Engine>());
}

HOTSTRING_API HotstringEngineHandle* hotstring_engine_new_with_options(
    int engine_kind,
    double timeout_seconds,
    size_t history_depth
) {
    if (history_depth == 0 ||
        (engine_kind != HotstringEngineKind_Dfa && engine_kind != HotstringEngineKind_Trie)) {
        return nullptr;
    }

    hotstring::Config config;
    config.engineKind = static_cast<hotstring::EngineKind>(engine_kind);
    config.timeoutSeconds = timeout_seconds;
    config.historyDepth = history_depth;
    return toHandle(std::make_unique<hotstring::Engine>(config));
}

HOTSTRING_API void hotstring_engine_free(HotstringEngineHandle* handle) {
    if (!handle) return;
    delete toEngine(handle);
}

// Rule loading
HOTSTRING_API HotstringResult hotstring_engine_set_rules(
    HotstringEngineHandle* handle,
    const HotstringRuleSpec* rules,
    size_t rule_count
) {
    if (!handle || (!rules && rule_count > 0)) {
        return HotstringResult_ErrorInvalidParameter;
    }

    auto engine = toEngine(handle);

    hotstring::RuleTable table;
    for (size_t i = 0; i < rule_count; ++i) {
        const HotstringRuleSpec& spec = rules[i];
        if (!spec.abbreviation) {
            return HotstringResult_ErrorInvalidParameter;
        }
        if (!table.emplace(spec.abbreviation, toRuleConfig(spec)).second) {
            hotstring::utils::warningLog(std::string("duplicate abbreviation \"") +
                                         spec.abbreviation + "\"");
            return HotstringResult_ErrorInvalidParameter;
        }
    }

    return toCResult(engine->setRules(table));
}

// Key processing
HOTSTRING_API HotstringResult hotstring_engine_process_char(
    HotstringEngineHandle* handle,
    uint32_t character,
    HotstringOutput* output
) {
    if (!handle || !output || character == 0 || character > 0x10FFFF) {
        return HotstringResult_ErrorInvalidParameter;
    }

    auto engine = toEngine(handle);

    auto result = engine->processKey(hotstring::Input::Character(static_cast<char32_t>(character)));
    fillOutput(result, output);

    return HotstringResult_Success;
}

HOTSTRING_API HotstringResult hotstring_engine_process_key_win(
    HotstringEngineHandle* handle,
    int vk_code,
    uint32_t character,
    int shift,
    int ctrl,
    int alt,
    int meta,
    HotstringOutput* output
) {
    if (!handle || !output || character > 0x10FFFF) {
        return HotstringResult_ErrorInvalidParameter;
    }

    auto engine = toEngine(handle);

    hotstring::Input input;
    input.keyCode = hotstring::VirtualKeyHelper::fromWindowsVK(vk_code);
    input.character = static_cast<char32_t>(character);
    input.modifiers.shift = shift != 0;
    input.modifiers.ctrl = ctrl != 0;
    input.modifiers.alt = alt != 0;
    input.modifiers.meta = meta != 0;

    auto result = engine->processKey(input);
    fillOutput(result, output);

    return HotstringResult_Success;
}

// Engine control
HOTSTRING_API HotstringResult hotstring_engine_delete(HotstringEngineHandle* handle) {
    if (!handle) {
        return HotstringResult_ErrorInvalidParameter;
    }

    auto engine = toEngine(handle);

    engine->handleDelete();
    return HotstringResult_Success;
}

HOTSTRING_API HotstringResult hotstring_engine_reset(HotstringEngineHandle* handle) {
    if (!handle) {
        return HotstringResult_ErrorInvalidParameter;
    }

    auto engine = toEngine(handle);

    engine->handleReset();
    return HotstringResult_Success;
}

HOTSTRING_API int hotstring_engine_check_timeout(HotstringEngineHandle* handle) {
    if (!handle) {
        return 0;
    }

    auto engine = toEngine(handle);

    return engine->checkTimeout() ? 1 : 0;
}

HOTSTRING_API char* hotstring_engine_get_abbreviation(HotstringEngineHandle* handle) {
    if (!handle) {
        return nullptr;
    }

    auto engine = toEngine(handle);

    return allocateAndCopyString(engine->getBufferText());
}

// Memory management
HOTSTRING_API void hotstring_free_string(char* s) {
    delete[] s;
}

HOTSTRING_API void hotstring_free_output(HotstringOutput* output) {
    if (!output) return;
    delete[] output->text;
    output->text = nullptr;
}

// Version info
HOTSTRING_API const char* hotstring_get_version(void) {
    return HOTSTRING_VERSION;
}

} // extern "C"
