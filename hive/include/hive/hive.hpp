#pragma once
// Hive: orchestration substrate for many unreliable units of work
//
// - Types: ids, clocks, clamping, atomic file save
// - Scheduler: bounded concurrency, retry, timeout, handoff drain
// - HandoffQueue: prioritized follow-up requests between roles
// - KnowledgeStore: shared records with pheromone trails
// - Retrieval: cached, quota-guarded federation of search providers

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "handoff_queue.hpp"
#include "scheduler.hpp"
#include "knowledge/record.hpp"
#include "knowledge/tag_index.hpp"
#include "knowledge/store.hpp"
#include "retrieval/provider.hpp"
#include "retrieval/cache.hpp"
#include "retrieval/quota.hpp"
#include "retrieval/registry.hpp"
#include "retrieval/result_aggregator.hpp"
#include "retrieval/aggregator.hpp"
