#pragma once

/**
 * @file promptchain.hpp
 * @brief Main header for the promptchain library
 *
 * Include this header to access prompts, model clients, output parsers and
 * chains in one go.
 */

// Core components
#include "core/types.hpp"
#include "core/base.hpp"

// Utility components
#include "utils/logging.hpp"
#include "utils/cancellation.hpp"

// Prompts, models, parsers
#include "prompts/prompt_template.hpp"
#include "llm/base_llm.hpp"
#include "llm/fake_llm.hpp"
#include "output_parsers/output_parser.hpp"

// Chains
#include "chains/base_chain.hpp"
#include "chains/options.hpp"
#include "chains/llm_chain.hpp"

/**
 * @namespace promptchain
 * @brief Prompt-to-model chains: render named inputs, call a model, parse the reply
 */
namespace promptchain {}
