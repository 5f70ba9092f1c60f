#pragma once

#include "../core/base.hpp"
#include "../core/types.hpp"
#include "../utils/cancellation.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <future>

namespace promptchain::chains {

/**
 * @brief Lazy sequence of stream items produced by a chain
 */
class ChainStream {
public:
    virtual ~ChainStream() = default;

    /**
     * @brief Pull the next item
     * @return The item, or nullopt once the stream has ended
     * @throws ChainException if producing this item failed
     */
    virtual std::optional<StreamData> next() = 0;
};

/**
 * @brief Handle to a chain operation running on another thread
 *
 * Dropping an unfinished task cancels it and waits for the worker, so no
 * partial result outlives the handle.
 */
template<typename T>
class ChainTask {
private:
    std::future<T> future_;
    utils::CancellationSource source_;

    void release() {
        if (future_.valid()) {
            source_.cancel();
            future_.wait();
        }
    }

public:
    ChainTask(std::future<T> future, utils::CancellationSource source)
        : future_(std::move(future)), source_(std::move(source)) {}

    ChainTask(ChainTask&& other) noexcept = default;

    ChainTask& operator=(ChainTask&& other) noexcept {
        if (this != &other) {
            release();
            future_ = std::move(other.future_);
            source_ = std::move(other.source_);
        }
        return *this;
    }

    ChainTask(const ChainTask&) = delete;
    ChainTask& operator=(const ChainTask&) = delete;

    ~ChainTask() {
        release();
    }

    /**
     * @brief Wait for the result
     * @throws ChainException raised by the operation
     */
    T get() { return future_.get(); }

    /**
     * @brief Block until the operation finishes; no-op once get() has run
     */
    void wait() const {
        if (future_.valid()) {
            future_.wait();
        }
    }

    void cancel() { source_.cancel(); }

    bool valid() const { return future_.valid(); }
};

/**
 * @brief Abstract base class for all chains
 *
 * Implementations are immutable once built; every operation is const and may
 * run concurrently on the same instance.
 */
class BaseChain {
public:
    virtual ~BaseChain() = default;

    /**
     * @brief Get input keys required by this chain
     */
    virtual std::vector<std::string> get_input_keys() const = 0;

    /**
     * @brief Get output keys produced by this chain
     */
    virtual std::vector<std::string> get_output_keys() const = 0;

    /**
     * @brief Run the chain and return the parsed result with its metadata
     */
    virtual GenerateResult call(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const = 0;

    /**
     * @brief Run the chain and return the raw generation
     */
    virtual std::string invoke(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const = 0;

    /**
     * @brief Run the chain and return its incremental output
     */
    virtual std::unique_ptr<ChainStream> stream(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const = 0;

    /**
     * @brief Run call() and key its generation by the first output key
     */
    virtual PromptArgs execute(const PromptArgs& args) const;

    /**
     * @brief Run call() on a worker thread
     *
     * The chain must outlive the returned task.
     */
    ChainTask<GenerateResult> call_async(PromptArgs args) const;

    /**
     * @brief Run invoke() on a worker thread
     *
     * The chain must outlive the returned task.
     */
    ChainTask<std::string> invoke_async(PromptArgs args) const;

    /**
     * @brief First required input key absent from args, if any
     */
    std::optional<std::string> validate_input(const PromptArgs& args) const;
};

} // namespace promptchain::chains
