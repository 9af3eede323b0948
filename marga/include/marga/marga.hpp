#pragma once
// Marga: graph path retrieval with flow pruning, tiered caching and
// token-bounded context assembly
//
// Pipeline per query:
//   anchor → GraphSource traversal → PathScorer → prune → TieredCache
//          → ContextAssembler (optional) → AnswerResult

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "error.hpp"
#include "serialize.hpp"
#include "path_scorer.hpp"
#include "graph_source.hpp"
#include "path_retriever.hpp"
#include "cache_tier.hpp"
#include "disk_tier.hpp"
#include "importance.hpp"
#include "tiered_cache.hpp"
#include "token_counter.hpp"
#include "context_assembler.hpp"
#include "orchestrator.hpp"
#include "config.hpp"
