/**
 * @file Evaluator.hpp
 * @brief Boundary to the source-expression language
 *
 * The engine treats expression evaluation as a pure function: program text,
 * input document and named variables in, ordered result list out. It only
 * composes the prelude around the user expression and binds the context.
 */

#ifndef JTL_EVALUATOR_HPP
#define JTL_EVALUATOR_HPP

#include "jtl/Value.hpp"
#include <map>
#include <string>
#include <vector>

namespace jtl {

/**
 * @brief Named variables visible to an evaluation (name without '$')
 */
using Bindings = std::map<std::string, Value>;

/**
 * @brief Expression evaluator interface
 */
class Evaluator {
public:
    virtual ~Evaluator() = default;

    /**
     * @brief Evaluate a program against a document
     *
     * @param program Full program text (prelude already composed)
     * @param document Input document
     * @param variables Variables bound for the evaluation
     * @return Every result, in order
     * @throws ExpressionError on syntax or runtime failure
     * @throws EvaluationTimeout when a deadline is configured and exceeded
     */
    virtual std::vector<Value> evaluate(const std::string& program,
                                        const Value& document,
                                        const Bindings& variables) const = 0;
};

/**
 * @brief Wrap an expression in a prelude
 *
 * Yields "<prelude>\n(<expression>)", or "(<expression>)" without prelude.
 * The newline keeps a trailing prelude comment from swallowing the expression.
 */
inline std::string compose_program(const std::string& prelude, const std::string& expression) {
    if (prelude.empty()) {
        return "(" + expression + ")";
    }
    return prelude + "\n(" + expression + ")";
}

} // namespace jtl

#endif // JTL_EVALUATOR_HPP
