/**
 * @file Chain.hpp
 * @brief Meta-chain specs and their sequential execution
 *
 * A chain runs ETL steps in order. Each step's output can feed the next one
 * through the "$prev" sentinel, used as `src` (read the previous output) or
 * as `dst` (seed the destination with a copy of it):
 *
 * ```json
 * {
 *   "ctx": {"env": "prod"},
 *   "steps": [
 *     {"etl": "extract.json", "src": "input.json"},
 *     {"etl": "enrich.json", "src": "$prev", "dst": "$prev",
 *      "options": {"delimiter": ", "}}
 *   ]
 * }
 * ```
 *
 * Step context = chain ctx, then the ETL spec's ctx, then the step's ctx,
 * deep-merged with later entries winning.
 */

#ifndef JTL_CHAIN_HPP
#define JTL_CHAIN_HPP

#include "jtl/Mapping.hpp"
#include "jtl/Options.hpp"
#include "jtl/Value.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jtl {

/// Reference text that stands for the previous step's output
inline constexpr const char* kPreviousOutput = "$prev";

/**
 * @brief Document reference of a step: a literal path or "$prev"
 */
struct DocumentRef {
    std::string ref;
    bool previous = false;

    static DocumentRef parse(const std::string& text) {
        if (text == kPreviousOutput) {
            return DocumentRef{"", true};
        }
        return DocumentRef{text, false};
    }

    /// Reference text as written in the step
    std::string text() const { return previous ? kPreviousOutput : ref; }
};

/**
 * @brief One chain step
 */
struct Step {
    std::string etl;
    DocumentRef source;
    std::optional<DocumentRef> destination;
    Value context = Value::object();
    std::optional<std::string> delimiter;  ///< used verbatim, no escape decoding
};

/**
 * @brief A parsed meta-chain spec
 */
struct ChainSpec {
    Value context = Value::object();
    std::vector<Step> steps;
};

/**
 * @brief Build a ChainSpec from a parsed meta spec document
 *
 * @throws FormatError when the document or a step has the wrong shape
 * @throws ConfigError when `steps` is missing or empty
 * @throws MissingRequiredFieldError when a step lacks `etl` or `src`
 */
ChainSpec parse_chain_spec(const Value& raw);

/**
 * @brief Where the chain runner reads ETL specs and documents from
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /**
     * @brief Read a referenced document
     * @throws FileNotFoundError / ParseError (or another TransformError)
     */
    virtual Value read(const std::string& ref) const = 0;

    /// Whether read() would find the reference
    virtual bool exists(const std::string& ref) const = 0;
};

enum class ChainState {
    NotStarted,
    Running,
    Completed,
    Failed,
};

const char* state_name(ChainState state) noexcept;

/**
 * @brief Runs chain steps against a document source
 *
 * Not reentrant: state() and current_step() describe the latest run().
 */
class ChainRunner {
public:
    ChainRunner(const Evaluator& evaluator,
                const DocumentSource& documents,
                EngineOptions options = {});

    /**
     * @brief Run every step and return the last step's output
     *
     * Any error moves the runner to Failed and propagates tagged with the
     * 1-based step index; no partial result is returned.
     *
     * @throws InvalidChainStateError when "$prev" is used by the first step
     */
    Value run(const ChainSpec& chain);

    ChainState state() const noexcept { return state_; }

    /// 1-based index of the step being (or last) run; 0 before the first run
    std::size_t current_step() const noexcept { return current_step_; }

    /// Write one line per step start and finish to out
    void set_trace(std::ostream& out) { trace_ = &out; }

private:
    const DocumentSource& documents_;
    MappingExecutor executor_;
    ChainState state_ = ChainState::NotStarted;
    std::size_t current_step_ = 0;
    std::ostream* trace_ = nullptr;

    Value run_step(const ChainSpec& chain,
                   const Step& step,
                   const std::optional<Value>& previous) const;
};

} // namespace jtl

#endif // JTL_CHAIN_HPP
