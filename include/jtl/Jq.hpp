/**
 * @file Jq.hpp
 * @brief Evaluator backed by libjq
 *
 * Each evaluate() call compiles the program in a fresh jq state, binds every
 * variable as a named argument (`ctx` becomes `$ctx`), runs it over the
 * document and collects the emitted values in order. Values cross into
 * and out of libjq as JSON text.
 */

#ifndef JTL_JQ_HPP
#define JTL_JQ_HPP

#include "jtl/Evaluator.hpp"
#include <chrono>
#include <optional>

namespace jtl {

/**
 * @brief jq evaluator
 *
 * Stateless apart from its deadline setting, so one instance can serve
 * every mapping of a run.
 */
class JqEvaluator : public Evaluator {
public:
    JqEvaluator() = default;

    /**
     * @param timeout Deadline for each evaluate() call, checked as each
     *        result is produced
     */
    explicit JqEvaluator(std::optional<std::chrono::milliseconds> timeout)
        : timeout_(timeout)
    {}

    /**
     * @throws ExpressionError on compile errors, runtime errors and
     *         halt_error with a non-zero exit code
     * @throws EvaluationTimeout when the deadline passes
     */
    std::vector<Value> evaluate(const std::string& program,
                                const Value& document,
                                const Bindings& variables) const override;

private:
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace jtl

#endif // JTL_JQ_HPP
