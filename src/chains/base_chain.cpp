#include "promptchain/chains/base_chain.hpp"
#include "promptchain/utils/logging.hpp"

namespace promptchain::chains {

PromptArgs BaseChain::execute(const PromptArgs& args) const {
    auto result = call(args);

    PromptArgs output;
    output[get_output_keys().front()] = std::move(result.generation);
    return output;
}

ChainTask<GenerateResult> BaseChain::call_async(PromptArgs args) const {
    utils::CancellationSource source;
    auto token = source.token();

    auto future = std::async(std::launch::async, [this, args = std::move(args), token]() {
        return this->call(args, token);
    });

    return ChainTask<GenerateResult>(std::move(future), std::move(source));
}

ChainTask<std::string> BaseChain::invoke_async(PromptArgs args) const {
    utils::CancellationSource source;
    auto token = source.token();

    auto future = std::async(std::launch::async, [this, args = std::move(args), token]() {
        return this->invoke(args, token);
    });

    return ChainTask<std::string>(std::move(future), std::move(source));
}

std::optional<std::string> BaseChain::validate_input(const PromptArgs& args) const {
    for (const auto& key : get_input_keys()) {
        if (args.find(key) == args.end()) {
            LOG_DEBUG("Missing required input key: " + key);
            return key;
        }
    }
    return std::nullopt;
}

} // namespace promptchain::chains
