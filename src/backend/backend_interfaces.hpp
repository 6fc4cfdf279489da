#ifndef PRIVGATE_BACKEND_BACKEND_INTERFACES_HPP
#define PRIVGATE_BACKEND_BACKEND_INTERFACES_HPP

#include <string>
#include <vector>
#include <map>
#include <cstddef>

/**
 * @file backend_interfaces.hpp
 * @brief Contracts that optional ML recognition/classification backends implement.
 *
 * The engine ships no model. A deployment that has an NER model or a toxicity
 * classifier wraps it in one of these interfaces and registers a factory with
 * BackendProbe. Implementations must be safe to call concurrently through a
 * const reference once constructed.
 *
 * A backend that loses its model at call time throws util::BackendUnavailableError;
 * the engine then serves that call from the pattern-based fallback.
 */

namespace privgate {
namespace backend {

/**
 * @struct RecognizedSpan
 * @brief Raw candidate produced by a recognition backend. `kind` uses the canonical
 *        entity names ("EMAIL_ADDRESS", "PERSON", ...). Offsets are UTF-8 byte offsets.
 */
struct RecognizedSpan
{
    std::string kind;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;
};

class EntityRecognitionBackend
{
public:
    virtual ~EntityRecognitionBackend() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Cheap availability check used by the probe. Must not throw.
     */
    virtual bool isAvailable() const noexcept = 0;

    /**
     * @brief Return raw candidate spans, in any order and possibly overlapping.
     * @throw util::BackendUnavailableError if the model cannot serve the call.
     */
    virtual std::vector<RecognizedSpan> recognize(const std::string &text) const = 0;
};

class ContentClassificationBackend
{
public:
    virtual ~ContentClassificationBackend() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Cheap availability check used by the probe. Must not throw.
     */
    virtual bool isAvailable() const noexcept = 0;

    /**
     * @brief Whole-text score per category name ("toxicity", "threat", ...).
     *        Unknown names are ignored by the engine; values are clamped to [0, 1].
     * @throw util::BackendUnavailableError if the model cannot serve the call.
     */
    virtual std::map<std::string, double> classify(const std::string &text) const = 0;
};

} // namespace backend
} // namespace privgate

#endif // PRIVGATE_BACKEND_BACKEND_INTERFACES_HPP
