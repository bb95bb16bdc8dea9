/**
 * @file Jq.cpp
 * @brief libjq-backed evaluator
 */

#include "jtl/Jq.hpp"
#include "jtl/Errors.hpp"

extern "C" {
#include <jq.h>
#include <jv.h>
}

#include <memory>

namespace jtl {

namespace {

// Owns one jv reference and frees it on scope exit.
class OwnedJv {
public:
    explicit OwnedJv(jv value) : value_(value) {}
    ~OwnedJv() { jv_free(value_); }

    OwnedJv(const OwnedJv&) = delete;
    OwnedJv& operator=(const OwnedJv&) = delete;

    jv_kind kind() const { return jv_get_kind(value_); }
    jv copy() const { return jv_copy(value_); }

    jv release() {
        jv out = value_;
        value_ = jv_invalid();
        return out;
    }

    void reset(jv value) {
        jv_free(value_);
        value_ = value;
    }

private:
    jv value_;
};

struct StateDeleter {
    void operator()(jq_state* state) const { jq_teardown(&state); }
};

using StatePtr = std::unique_ptr<jq_state, StateDeleter>;

// Consumes a string jv.
std::string take_string(jv text) {
    const char* data = jv_string_value(text);
    const int length = jv_string_length_bytes(jv_copy(text));
    std::string out(data, static_cast<std::size_t>(length));
    jv_free(text);
    return out;
}

// Error payloads may be any value; non-strings are rendered as JSON.
std::string message_text(jv message) {
    switch (jv_get_kind(message)) {
        case JV_KIND_STRING:
            return take_string(message);
        case JV_KIND_INVALID:
            jv_free(message);
            return "unknown jq error";
        default:
            return take_string(jv_dump_string(message, 0));
    }
}

jv to_jv(const Value& value, const std::string& program) {
    const std::string text = value.dump(-1, ' ', false, Value::error_handler_t::replace);
    jv parsed = jv_parse_sized(text.data(), static_cast<int>(text.size()));
    if (jv_get_kind(parsed) == JV_KIND_INVALID) {
        throw ExpressionError(program, "cannot pass value to jq: " +
                                       message_text(jv_invalid_get_msg(parsed)));
    }
    return parsed;
}

// Consumes the jv.
Value from_jv(jv value) {
    return Value::parse(take_string(jv_dump_string(value, 0)));
}

void collect_error(void* data, jv message) {
    auto* messages = static_cast<std::vector<std::string>*>(data);
    jv formatted = jq_format_error(message);
    if (jv_get_kind(formatted) == JV_KIND_STRING) {
        messages->push_back(take_string(formatted));
    } else {
        jv_free(formatted);
    }
}

std::string join_messages(const std::vector<std::string>& messages) {
    if (messages.empty()) return "jq compile error";
    std::string out = messages.front();
    for (std::size_t i = 1; i < messages.size(); ++i) {
        out += "; " + messages[i];
    }
    return out;
}

} // namespace

std::vector<Value> JqEvaluator::evaluate(const std::string& program,
                                         const Value& document,
                                         const Bindings& variables) const {
    const auto started = std::chrono::steady_clock::now();
    auto check_deadline = [&]() {
        if (timeout_ && std::chrono::steady_clock::now() - started > *timeout_) {
            throw EvaluationTimeout(program, *timeout_);
        }
    };

    StatePtr state(jq_init());
    if (!state) {
        throw ExpressionError(program, "could not initialize jq");
    }

    std::vector<std::string> messages;
    jq_set_error_cb(state.get(), collect_error, &messages);

    OwnedJv arguments(jv_object());
    for (const auto& [name, value] : variables) {
        jv bound = to_jv(value, program);
        arguments.reset(jv_object_set(arguments.release(),
                                      jv_string_sized(name.data(), static_cast<int>(name.size())),
                                      bound));
    }

    if (!jq_compile_args(state.get(), program.c_str(), arguments.release())) {
        throw ExpressionError(program, join_messages(messages));
    }

    jq_start(state.get(), to_jv(document, program), 0);

    std::vector<Value> results;
    for (;;) {
        OwnedJv next(jq_next(state.get()));
        if (next.kind() == JV_KIND_INVALID) {
            if (jv_invalid_has_msg(next.copy())) {
                throw ExpressionError(program, message_text(jv_invalid_get_msg(next.release())));
            }
            break;
        }
        results.push_back(from_jv(next.release()));
        check_deadline();
    }

    if (jq_halted(state.get())) {
        OwnedJv code(jq_get_exit_code(state.get()));
        if (code.kind() == JV_KIND_NUMBER && jv_number_value(code.copy()) != 0) {
            throw ExpressionError(program, message_text(jq_get_error_message(state.get())));
        }
    }

    check_deadline();
    return results;
}

} // namespace jtl
