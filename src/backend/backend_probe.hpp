#ifndef PRIVGATE_BACKEND_BACKEND_PROBE_HPP
#define PRIVGATE_BACKEND_BACKEND_PROBE_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <utility>
#include "backend/backend_interfaces.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

/**
 * @file backend_probe.hpp
 * @brief One-shot startup detection of optional ML backends.
 *
 * LIFECYCLE:
 *   1. At process start, register a factory for every backend the deployment may carry.
 *   2. Call probe() once. Each factory is invoked in registration order; the first backend
 *      that constructs and reports isAvailable() wins its slot.
 *   3. The resulting BackendHandle is immutable. Pass it by reference into
 *      makeEntityDetector() / makeContentClassifier(); those pick the ML-backed or the
 *      pattern-based variant once, never per call.
 *   4. Teardown is the handle's destruction: backends are released when the last
 *      detector/classifier holding them goes away.
 *
 * USAGE:
 *   @code
 *   privgate::backend::BackendProbe probe;
 *   probe.registerRecognizer("onnx-ner", [] { return std::make_shared<MyNer>("model.onnx"); });
 *   const privgate::backend::BackendHandle handle = probe.probe();
 *   auto detector = privgate::detection::makeEntityDetector(handle);
 *   @endcode
 */

namespace privgate {
namespace backend {

/**
 * @class BackendHandle
 * @brief Immutable capability set produced by BackendProbe::probe().
 *        Either slot may be empty; empty means "use the pattern-based fallback".
 */
class BackendHandle
{
public:
    BackendHandle() = default;

    BackendHandle(std::shared_ptr<const EntityRecognitionBackend> recognizer,
                  std::shared_ptr<const ContentClassificationBackend> classifier)
        : recognizer_(std::move(recognizer))
        , classifier_(std::move(classifier))
    {
    }

    bool hasRecognizer() const { return recognizer_ != nullptr; }
    bool hasClassifier() const { return classifier_ != nullptr; }

    const std::shared_ptr<const EntityRecognitionBackend>& recognizer() const { return recognizer_; }
    const std::shared_ptr<const ContentClassificationBackend>& classifier() const { return classifier_; }

    std::string describe() const
    {
        return std::string("recognizer=") + (recognizer_ ? recognizer_->name() : "pattern-fallback")
             + ", classifier=" + (classifier_ ? classifier_->name() : "pattern-fallback");
    }

private:
    std::shared_ptr<const EntityRecognitionBackend> recognizer_;
    std::shared_ptr<const ContentClassificationBackend> classifier_;
};

/**
 * @class BackendProbe
 * @brief Collects backend factories and resolves them into a BackendHandle.
 */
class BackendProbe
{
public:
    using RecognizerFactory = std::function<std::shared_ptr<EntityRecognitionBackend>()>;
    using ClassifierFactory = std::function<std::shared_ptr<ContentClassificationBackend>()>;

    void registerRecognizer(const std::string &name, RecognizerFactory factory)
    {
        recognizers_.emplace_back(name, std::move(factory));
    }

    void registerClassifier(const std::string &name, ClassifierFactory factory)
    {
        classifiers_.emplace_back(name, std::move(factory));
    }

    /**
     * @brief Resolve registered factories. Absent backends never make this throw: a
     *        factory that throws BackendUnavailableError, returns null, or yields a
     *        backend reporting !isAvailable() is skipped with a log line.
     */
    BackendHandle probe() const
    {
        auto recognizer = firstAvailable(recognizers_, "recognizer");
        auto classifier = firstAvailable(classifiers_, "classifier");

        BackendHandle handle(std::move(recognizer), std::move(classifier));
        util::logger::info("BackendProbe: " + handle.describe());
        if (!handle.hasRecognizer()) {
            util::logger::warn("BackendProbe: no recognition backend available, "
                               "entity detection runs in pattern-based mode.");
        }
        if (!handle.hasClassifier()) {
            util::logger::warn("BackendProbe: no classification backend available, "
                               "content scoring runs in lexicon-based mode.");
        }
        return handle;
    }

private:
    template<typename Backend>
    static std::shared_ptr<const Backend> firstAvailable(
        const std::vector<std::pair<std::string, std::function<std::shared_ptr<Backend>()>>> &factories,
        const std::string &slot)
    {
        for (const auto &entry : factories) {
            std::shared_ptr<Backend> candidate;
            try {
                candidate = entry.second();
            }
            catch (const util::BackendUnavailableError &ex) {
                util::logger::info("BackendProbe: " + slot + " '" + entry.first
                                   + "' not available: " + ex.what());
                continue;
            }
            if (!candidate || !candidate->isAvailable()) {
                util::logger::info("BackendProbe: " + slot + " '" + entry.first
                                   + "' reported unavailable.");
                continue;
            }
            util::logger::debug("BackendProbe: selected " + slot + " '" + entry.first + "'");
            return candidate;
        }
        return nullptr;
    }

    std::vector<std::pair<std::string, RecognizerFactory>> recognizers_;
    std::vector<std::pair<std::string, ClassifierFactory>> classifiers_;
};

} // namespace backend
} // namespace privgate

#endif // PRIVGATE_BACKEND_BACKEND_PROBE_HPP
