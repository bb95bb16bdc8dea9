/**
 * @file Mapping.cpp
 * @brief Implementation of mapping execution
 */

#include "jtl/Mapping.hpp"
#include "jtl/Errors.hpp"
#include "jtl/Merge.hpp"
#include "jtl/Navigator.hpp"
#include "jtl/Path.hpp"

#include <utility>

namespace jtl {

MappingExecutor::MappingExecutor(const Evaluator& evaluator, EngineOptions options)
    : evaluator_(evaluator)
    , options_(std::move(options))
{
    options_.validate();
}

std::vector<Value> MappingExecutor::evaluate(const Mapping& mapping,
                                             const Value& source,
                                             const Value& context,
                                             const std::string& prelude) const {
    const std::string program = compose_program(prelude, mapping.source);
    try {
        return evaluator_.evaluate(program, source, Bindings{{"ctx", context}});
    } catch (const TransformError&) {
        throw;
    } catch (const std::exception& e) {
        // Evaluators outside this library may raise their own types
        throw ExpressionError(program, e.what());
    }
}

void MappingExecutor::apply(const Mapping& mapping,
                            const Value& source,
                            const Value& context,
                            const std::string& prelude,
                            Value& destination,
                            const std::string& delimiter) const {
    const Mode mode = mapping.mode.value_or(options_.default_mode);
    std::vector<Value> results = evaluate(mapping, source, context, prelude);

    const Path path = parse_path(mapping.destination);
    const std::string& delim = mapping.delimiter ? *mapping.delimiter : delimiter;

    if (mode == Mode::Replace) {
        Value incoming;
        if (results.size() == 1) {
            incoming = std::move(results.front());
        } else if (results.size() > 1) {
            incoming = Value::array();
            for (auto& result : results) {
                incoming.push_back(std::move(result));
            }
        }
        Value& slot = target_slot(destination, path);
        slot = replace_value(slot, incoming);
        return;
    }

    if (results.empty()) {
        return;
    }
    Value& slot = target_slot(destination, path);
    for (const auto& result : results) {
        slot = upsert_value(std::move(slot), result, delim);
    }
}

void MappingExecutor::run(const EtlSpec& spec,
                          const Value& source,
                          Value& destination,
                          const std::string& delimiter) const {
    for (std::size_t i = 0; i < spec.mappings.size(); ++i) {
        try {
            apply(spec.mappings[i], source, spec.context, spec.prelude, destination, delimiter);
        } catch (TransformError& e) {
            e.set_mapping(i + 1);
            throw;
        }
    }
}

} // namespace jtl
