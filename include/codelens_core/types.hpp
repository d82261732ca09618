#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. codelens_core/types/chunk.hpp),
// users can simply do `#include "codelens_core/types.hpp"`.
//
#include "codelens_core/types/chunk.hpp"
#include "codelens_core/types/chunk_filter.hpp"
#include "codelens_core/types/file_change.hpp"
#include "codelens_core/types/llm.hpp"
