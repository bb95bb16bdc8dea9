/**
 * @file Chain.cpp
 * @brief Implementation of meta-chain parsing and execution
 */

#include "jtl/Chain.hpp"
#include "jtl/Errors.hpp"
#include "jtl/Merge.hpp"
#include "jtl/SpecLoader.hpp"

#include <utility>

namespace jtl {

// ============================================================================
// Parsing
// ============================================================================

namespace {

/**
 * @brief Required non-empty string field of a step
 */
std::string required_reference(const Value& step, const char* field) {
    auto it = step.find(field);
    if (it == step.end() || it->is_null()) {
        throw MissingRequiredFieldError(field, "step");
    }
    if (!it->is_string()) {
        throw FormatError(std::string("step field '") + field +
                          "' must be a string, got " + type_name(*it));
    }
    if (it->get_ref<const std::string&>().empty()) {
        throw MissingRequiredFieldError(field, "step");
    }
    return it->get<std::string>();
}

/**
 * @brief Optional object field; null counts as absent
 */
const Value* optional_object(const Value& owner, const char* field, const std::string& what) {
    auto it = owner.find(field);
    if (it == owner.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw FormatError(what + " '" + field + "' must be an object, got " + type_name(*it));
    }
    return &*it;
}

Step parse_step(const Value& raw) {
    if (!raw.is_object()) {
        throw FormatError("step must be an object, got " + type_name(raw));
    }

    Step step;
    step.etl = required_reference(raw, "etl");
    step.source = DocumentRef::parse(required_reference(raw, "src"));

    auto dst = raw.find("dst");
    if (dst != raw.end() && !dst->is_null()) {
        if (!dst->is_string()) {
            throw FormatError("step field 'dst' must be a string, got " + type_name(*dst));
        }
        // an empty dst seeds the destination with {}
        if (!dst->get_ref<const std::string&>().empty()) {
            step.destination = DocumentRef::parse(dst->get<std::string>());
        }
    }

    if (const Value* ctx = optional_object(raw, "ctx", "step field")) {
        step.context = *ctx;
    }

    if (const Value* options = optional_object(raw, "options", "step field")) {
        auto delimiter = options->find("delimiter");
        if (delimiter != options->end() && !delimiter->is_null()) {
            if (!delimiter->is_string()) {
                throw FormatError("step option 'delimiter' must be a string, got " +
                                  type_name(*delimiter));
            }
            step.delimiter = delimiter->get<std::string>();
        }
    }

    return step;
}

} // namespace

ChainSpec parse_chain_spec(const Value& raw) {
    if (!raw.is_object()) {
        throw FormatError("chain spec must be an object, got " + type_name(raw));
    }

    ChainSpec chain;
    if (const Value* ctx = optional_object(raw, "ctx", "chain field")) {
        chain.context = *ctx;
    }

    auto steps = raw.find("steps");
    if (steps != raw.end() && !steps->is_null() && !steps->is_array()) {
        throw FormatError("'steps' must be an array, got " + type_name(*steps));
    }
    if (steps == raw.end() || steps->is_null() || steps->empty()) {
        throw ConfigError("'steps' must be a non-empty array");
    }

    for (std::size_t i = 0; i < steps->size(); ++i) {
        try {
            chain.steps.push_back(parse_step((*steps)[i]));
        } catch (TransformError& e) {
            e.set_step(i + 1);
            throw;
        }
    }
    return chain;
}

// ============================================================================
// Execution
// ============================================================================

const char* state_name(ChainState state) noexcept {
    switch (state) {
        case ChainState::NotStarted: return "not started";
        case ChainState::Running: return "running";
        case ChainState::Completed: return "completed";
        case ChainState::Failed: return "failed";
    }
    return "unknown";
}

ChainRunner::ChainRunner(const Evaluator& evaluator,
                         const DocumentSource& documents,
                         EngineOptions options)
    : documents_(documents)
    , executor_(evaluator, std::move(options))
{}

Value ChainRunner::run(const ChainSpec& chain) {
    state_ = ChainState::Running;
    current_step_ = 0;

    try {
        if (chain.steps.empty()) {
            throw ConfigError("chain has no steps");
        }

        std::optional<Value> previous;
        for (std::size_t i = 0; i < chain.steps.size(); ++i) {
            current_step_ = i + 1;
            try {
                previous = run_step(chain, chain.steps[i], previous);
            } catch (TransformError& e) {
                e.set_step(current_step_);
                throw;
            }
        }

        state_ = ChainState::Completed;
        return std::move(*previous);
    } catch (const std::exception&) {
        state_ = ChainState::Failed;
        throw;
    }
}

Value ChainRunner::run_step(const ChainSpec& chain,
                            const Step& step,
                            const std::optional<Value>& previous) const {
    const std::size_t total = chain.steps.size();
    if (trace_) {
        *trace_ << "[jtl] step " << current_step_ << "/" << total
                << ": etl=" << step.etl << " src=" << step.source.text()
                << " dst=" << (step.destination ? step.destination->text() : "{}") << "\n";
    }

    EtlSpec etl = load_etl_spec(documents_.read(step.etl));

    Value context = chain.context;
    deep_merge(context, etl.context);
    deep_merge(context, step.context);
    etl.context = std::move(context);

    auto require_previous = [&](const char* field) -> const Value& {
        if (!previous) {
            throw InvalidChainStateError(std::string(field) + " '" + kPreviousOutput +
                                         "' used but no previous output exists");
        }
        return *previous;
    };

    Value loaded_source;
    const Value* source = nullptr;
    if (step.source.previous) {
        source = &require_previous("src");
    } else {
        loaded_source = documents_.read(step.source.ref);
        source = &loaded_source;
    }

    Value destination = Value::object();
    if (step.destination) {
        if (step.destination->previous) {
            destination = require_previous("dst");
        } else if (documents_.exists(step.destination->ref)) {
            destination = documents_.read(step.destination->ref);
        }
    }

    const std::string& delimiter = step.delimiter ? *step.delimiter : executor_.options().delimiter;
    executor_.run(etl, *source, destination, delimiter);

    if (trace_) {
        *trace_ << "[jtl] step " << current_step_ << "/" << total << ": "
                << etl.mappings.size() << " mapping(s) applied\n";
    }
    return destination;
}

} // namespace jtl
