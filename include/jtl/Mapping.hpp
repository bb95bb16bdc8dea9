/**
 * @file Mapping.hpp
 * @brief Mapping rules and their execution against a destination tree
 *
 * A mapping evaluates a source expression and writes every result at a
 * concrete destination path:
 * - replace: zero results write null, one writes the value, more write an
 *   array of all results;
 * - upsert: each result is merged in turn (see upsert_value()); no results
 *   leave the destination untouched.
 */

#ifndef JTL_MAPPING_HPP
#define JTL_MAPPING_HPP

#include "jtl/Evaluator.hpp"
#include "jtl/Options.hpp"
#include "jtl/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace jtl {

/**
 * @brief One source expression → destination path rule
 */
struct Mapping {
    std::string source;                    ///< expression text
    std::string destination;               ///< destination path text
    std::optional<Mode> mode;              ///< none: EngineOptions::default_mode
    std::optional<std::string> delimiter;  ///< decoded string-upsert separator
};

/**
 * @brief A loaded ETL spec
 */
struct EtlSpec {
    std::vector<Mapping> mappings;
    Value context = Value::object();
    std::string prelude;
};

/**
 * @brief Applies mappings through an Evaluator
 *
 * The executor holds a reference to the evaluator; the evaluator must
 * outlive it.
 */
class MappingExecutor {
public:
    explicit MappingExecutor(const Evaluator& evaluator, EngineOptions options = {});

    /**
     * @brief Apply one mapping to destination in place
     *
     * @param mapping Rule to apply
     * @param source Document the expression runs against
     * @param context Bound as $ctx
     * @param prelude Text composed before the expression
     * @param destination Tree being built
     * @param delimiter Default separator when the mapping has none
     *
     * @throws ExpressionError or EvaluationTimeout from evaluation
     * @throws SyntaxError for a malformed destination path
     * @throws TypeMismatchError when the path conflicts with the tree
     */
    void apply(const Mapping& mapping,
               const Value& source,
               const Value& context,
               const std::string& prelude,
               Value& destination,
               const std::string& delimiter) const;

    /**
     * @brief Apply every mapping of spec in order
     *
     * Errors are tagged with the 1-based index of the failing mapping.
     */
    void run(const EtlSpec& spec,
             const Value& source,
             Value& destination,
             const std::string& delimiter) const;

    /// run() with the configured default delimiter
    void run(const EtlSpec& spec, const Value& source, Value& destination) const {
        run(spec, source, destination, options_.delimiter);
    }

    const EngineOptions& options() const noexcept { return options_; }

private:
    const Evaluator& evaluator_;
    EngineOptions options_;

    std::vector<Value> evaluate(const Mapping& mapping,
                                const Value& source,
                                const Value& context,
                                const std::string& prelude) const;
};

} // namespace jtl

#endif // JTL_MAPPING_HPP
