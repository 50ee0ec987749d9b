// Asserts must fire in every build type
#undef NDEBUG

#include <hive/hive.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <thread>
#include <chrono>
#include <set>
#include <algorithm>
#include <mutex>

using namespace hive;

static SearchResult make_result(const std::string& url, float score,
                                const std::string& date = "") {
    SearchResult r;
    r.url = url;
    r.title = url;
    r.score = score;
    r.published_date = date;
    return r;
}

static BasicRecord make_basic(const std::string& role, const std::string& content,
                              float quality, std::vector<std::string> refs = {}) {
    BasicRecord b;
    b.producer_role = role;
    b.content = content;
    b.quality_score = quality;
    b.references = std::move(refs);
    return b;
}

static TypedRecord make_typed(const std::string& role, Dimension dim, SignalType type,
                              float strength, float confidence,
                              std::vector<std::string> tags = {}) {
    TypedRecord t;
    t.producer_role = role;
    t.dimension = dim;
    t.type = type;
    t.evidence = role + " evidence";
    t.strength = strength;
    t.confidence = confidence;
    t.tags = std::move(tags);
    return t;
}

// Provider double: fixed answers, call counting, switchable failures
class FakeProvider : public SearchProvider {
public:
    FakeProvider(std::string name, int priority, std::vector<SearchResult> results)
        : name_(std::move(name)), priority_(priority), results_(std::move(results)) {}

    std::vector<SearchResult> search(const std::string&, TimeRange, size_t) override {
        calls++;
        if (throws) throw TransientFailure("upstream 503");
        if (throws_foreign) throw "boom";
        if (empty) return {};
        return results_;
    }

    bool health_check() override {
        if (health_throws) throw 7;
        return healthy;
    }

    ProviderMetadata metadata() const override {
        ProviderMetadata m;
        m.name = name_;
        m.priority = priority_;
        m.description = "test double";
        return m;
    }

    std::atomic<int> calls{0};
    bool healthy = true;
    bool throws = false;
    bool throws_foreign = false;
    bool health_throws = false;
    bool empty = false;

private:
    std::string name_;
    int priority_;
    std::vector<SearchResult> results_;
};

static SchedulerConfig fast_config() {
    SchedulerConfig config;
    config.max_concurrent = 4;
    config.max_retries = 1;
    config.backoff_base_ms = 1;
    config.backoff_multiplier = 2.0;
    config.backoff_cap_ms = 10;
    config.timeout_ms = 5000;
    return config;
}

static QuotaConfig memory_quota() {
    QuotaConfig config;
    config.path = "";
    return config;
}

static CacheConfig memory_cache(bool enabled = true) {
    CacheConfig config;
    config.enabled = enabled;
    config.path = "";
    return config;
}

// ═══════════════════════════════════════════════════════════════════════════
// Types, config
// ═══════════════════════════════════════════════════════════════════════════

void test_types() {
    std::cout << "Testing types..." << std::endl;

    assert(clamp01(1.7f) == 1.0f);
    assert(clamp01(-0.2f) == 0.0f);
    assert(clamp01(std::nanf("")) == 0.0f);
    assert(clamp01(0.25f) == 0.25f);

    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(new_id());
    assert(ids.size() == 1000);
    assert(new_id().size() == 36);

    assert(fnv1a64("hive") == fnv1a64("hive"));
    assert(fnv1a64("hive") != fnv1a64("Hive"));
    assert(to_hex(255) == "00000000000000ff");

    std::string wide;
    for (int i = 0; i < 10; ++i) wide += "市";        // 3 bytes each
    assert(utf8_prefix(wide, 30) == wide);
    assert(utf8_prefix(wide, 7).size() == 6);
    assert(utf8_prefix(wide, 2).empty());
    assert(utf8_prefix("abc", 2) == "ab");

    std::string date = local_date(now());
    assert(date.size() == 10);
    assert(date[4] == '-' && date[7] == '-');

    const std::string path = "/tmp/hive_test_dir/nested/file.txt";
    ensure_parent_dir(path);
    assert(safe_save_text(path, "hello"));
    auto text = read_text(path);
    assert(text.has_value());
    assert(*text == "hello");
    std::remove(path.c_str());
    assert(!read_text(path).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    auto cfg = parse_config(R"({
        "scheduler": {"max_concurrent": 8, "timeout_ms": 1000},
        "cache": {"ttl_seconds": 60},
        "retrieval": {
            "mode": "parallel",
            "sort": "diverse",
            "time_range": "oneMonth",
            "providers": {"tavily": {"priority": 20, "daily_quota": 100}},
            "profiles": {"scout": {"preferred_providers": ["tavily"], "max_results": 5, "mode": "all"}}
        }
    })");
    assert(cfg.has_value());
    assert(cfg->scheduler.max_concurrent == 8);
    assert(cfg->scheduler.timeout_ms == 1000);
    assert(cfg->scheduler.max_retries == 1);          // Default kept
    assert(cfg->scheduler.backoff_cap_ms == 30000);
    assert(cfg->cache.ttl_seconds == 60);
    assert(cfg->cache.enabled);
    assert(cfg->retrieval.mode == AggregationMode::Parallel);
    assert(cfg->retrieval.sort == SortStrategy::Diverse);
    assert(cfg->retrieval.time_range == TimeRange::OneMonth);
    assert(cfg->retrieval.providers.at("tavily").priority == 20);
    assert(cfg->retrieval.providers.at("tavily").daily_quota == 100);
    assert(!cfg->retrieval.providers.at("tavily").rate_limit.has_value());
    assert(cfg->retrieval.profiles.at("scout").max_results == 5);
    assert(cfg->retrieval.profiles.at("scout").mode == AggregationMode::All);

    assert(!parse_config("{not json").has_value());
    assert(!parse_config("[1, 2]").has_value());
    assert(!load_config("/tmp/hive_test_missing_config.json").has_value());

    // Negative counts clamp instead of wrapping
    auto negative = parse_config(R"({
        "scheduler": {"max_retries": -1, "max_concurrent": -4},
        "retrieval": {"max_parallel_providers": 0, "max_results": -10}
    })");
    assert(negative.has_value());
    assert(negative->scheduler.max_retries == 0);
    assert(negative->scheduler.max_concurrent == 1);
    assert(negative->retrieval.max_parallel_providers == 1);
    assert(negative->retrieval.max_results == 1);

    auto empty = parse_config("{}");
    assert(empty.has_value());
    assert(empty->scheduler.max_concurrent == 4);
    assert(empty->retrieval.mode == AggregationMode::Priority);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HandoffQueue
// ═══════════════════════════════════════════════════════════════════════════

void test_handoff_ordering() {
    std::cout << "Testing HandoffQueue ordering..." << std::endl;

    HandoffQueue queue;
    queue.create("scout", "market", {}, HandoffPriority::Critical);
    auto m1 = queue.create("scout", "market", {}, HandoffPriority::Medium);
    queue.create("scout", "market", {}, HandoffPriority::High);
    queue.create("scout", "market", {}, HandoffPriority::Low);
    auto m2 = queue.create("scout", "market", {}, HandoffPriority::Medium);

    auto pending = queue.list_pending();
    assert(pending.size() == 5);
    assert(pending[0].priority == HandoffPriority::Critical);
    assert(pending[1].priority == HandoffPriority::High);
    assert(pending[2].priority == HandoffPriority::Medium);
    assert(pending[2].id == m1.id);                    // Insertion order breaks ties
    assert(pending[3].id == m2.id);
    assert(pending[4].priority == HandoffPriority::Low);

    auto urgent = queue.list_pending(std::nullopt, HandoffPriority::High);
    assert(urgent.size() == 2);

    assert(queue.list_pending(std::string("technical")).empty());

    std::cout << "  PASS" << std::endl;
}

void test_handoff_state_machine() {
    std::cout << "Testing HandoffQueue state machine..." << std::endl;

    HandoffQueue queue;
    HandoffContext ctx;
    ctx.reasoning = "pricing looks off";
    ctx.suggested_actions = {"compare tiers"};
    ctx.relevant_data = {{"competitor", "acme"}};
    auto h = queue.create("scout", "market", ctx, HandoffPriority::High);

    assert(h.status == HandoffStatus::Pending);
    assert(!queue.update_status("missing", HandoffStatus::InProgress));
    assert(!queue.update_status(h.id, HandoffStatus::Completed));    // Must start first

    assert(queue.update_status(h.id, HandoffStatus::InProgress));
    assert(!queue.cancel(h.id));                                     // Already started
    assert(queue.update_status(h.id, HandoffStatus::Completed, std::string("done")));
    assert(!queue.update_status(h.id, HandoffStatus::Failed));       // Terminal

    auto stored = queue.get(h.id);
    assert(stored.has_value());
    assert(stored->status == HandoffStatus::Completed);
    assert(stored->result == std::string("done"));
    assert(stored->updated_at >= stored->created_at);

    auto other = queue.create("market", "technical", ctx);
    assert(queue.cancel(other.id));
    assert(queue.get(other.id)->status == HandoffStatus::Cancelled);
    assert(!queue.update_status(other.id, HandoffStatus::InProgress));

    queue.create("ux", "market", ctx, HandoffPriority::Low);
    auto contexts = queue.get_context_for("market");
    assert(contexts.size() == 1);
    assert(contexts[0].reasoning == "pricing looks off");

    assert(queue.by_roles(std::string("scout"), std::nullopt).size() == 1);
    assert(queue.by_roles(std::nullopt, std::string("market")).size() == 2);
    assert(queue.all().size() == 3);
    assert(queue.pending_count() == 1);

    json j = *stored;
    assert(j["status"] == "completed");
    assert(j["priority"] == "high");
    assert(j["context"]["relevant_data"]["competitor"] == "acme");

    queue.clear();
    assert(queue.size() == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler
// ═══════════════════════════════════════════════════════════════════════════

void test_scheduler_basic() {
    std::cout << "Testing Scheduler basic run..." << std::endl;

    auto scout = std::make_shared<FunctionExecutable>("scout", [](const json& ctx) {
        return json{{"target", ctx.value("target", "")}};
    });
    auto market = std::make_shared<FunctionExecutable>("market", [](const json&) -> json {
        throw FatalFailure("no data");
    });

    std::vector<Task> tasks;
    tasks.emplace_back(scout, json{{"target", "acme"}});
    tasks.emplace_back(scout, json{{"target", "globex"}});
    tasks.emplace_back(market);

    Scheduler scheduler(fast_config());
    auto result = scheduler.run(std::move(tasks));

    assert(result.total == 3);
    assert(result.completed == 2);
    assert(result.failed == 1);
    assert(result.cancelled == 0);
    assert(result.duration_ms >= 0);

    auto grouped = Scheduler::collect_results(result.tasks);
    assert(grouped["scout"].size() == 2);
    assert(grouped.count("market") == 0);

    auto errors = Scheduler::errors(result.tasks);
    assert(errors.size() == 1);
    assert(errors[0].role == "market");
    assert(errors[0].error == "no data");

    for (const auto& t : result.tasks) {
        assert(t.started_at > 0);
        assert(t.completed_at >= t.started_at);
    }

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_concurrency_cap() {
    std::cout << "Testing Scheduler concurrency cap..." << std::endl;

    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto unit = std::make_shared<FunctionExecutable>("worker", [&](const json&) {
        int now_running = ++running;
        int seen = peak.load();
        while (now_running > seen && !peak.compare_exchange_weak(seen, now_running)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --running;
        return json(true);
    });

    std::vector<Task> tasks;
    for (int i = 0; i < 10; ++i) tasks.emplace_back(unit);

    auto config = fast_config();
    config.max_concurrent = 3;
    Scheduler scheduler(config);
    auto result = scheduler.run(std::move(tasks));

    assert(result.completed == 10);
    assert(peak.load() <= 3);
    assert(peak.load() >= 1);

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_retry() {
    std::cout << "Testing Scheduler retry..." << std::endl;

    std::atomic<int> calls{0};
    std::vector<int> attempts_seen;
    std::mutex seen_mutex;

    auto flaky = std::make_shared<FunctionExecutable>("flaky", [&](const json& ctx) {
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            attempts_seen.push_back(ctx["_attempt"].get<int>());
        }
        if (++calls <= 2) throw TransientFailure("connection reset");
        return json("ok");
    });

    auto config = fast_config();
    config.max_retries = 3;
    Scheduler scheduler(config);

    std::vector<Task> tasks;
    tasks.emplace_back(flaky, json::object(), "flaky-1");
    auto result = scheduler.run(std::move(tasks));

    assert(result.completed == 1);
    const auto& t = result.tasks[0];
    assert(t.status == TaskStatus::Completed);
    assert(t.attempts == 3);
    assert(calls.load() == 3);
    assert(t.result == "ok");
    assert(!t.error.has_value());
    assert((attempts_seen == std::vector<int>{1, 2, 3}));

    // Exhausted retries keep the last error
    auto always = std::make_shared<FunctionExecutable>("broken", [](const json&) -> json {
        throw std::runtime_error("still broken");
    });
    std::vector<Task> more;
    more.emplace_back(always);
    auto failed = scheduler.run(std::move(more));
    assert(failed.failed == 1);
    assert(failed.tasks[0].attempts == 4);
    assert(*failed.tasks[0].error == "still broken");

    // Backoff: min(cap, base * multiplier^retry)
    SchedulerConfig bc;
    bc.backoff_base_ms = 2000;
    bc.backoff_multiplier = 2.0;
    bc.backoff_cap_ms = 30000;
    Scheduler backoff(bc);
    assert(backoff.backoff_ms(1) == 4000);
    assert(backoff.backoff_ms(2) == 8000);
    assert(backoff.backoff_ms(4) == 30000);

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_timeout() {
    std::cout << "Testing Scheduler timeout..." << std::endl;

    auto slow = std::make_shared<FunctionExecutable>("slow", [](const json&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return json("late");
    });

    auto config = fast_config();
    config.timeout_ms = 40;
    config.max_retries = 1;
    Scheduler scheduler(config);

    std::vector<Task> tasks;
    tasks.emplace_back(slow);
    auto result = scheduler.run(std::move(tasks));

    assert(result.failed == 1);
    const auto& t = result.tasks[0];
    assert(t.status == TaskStatus::Failed);
    assert(t.attempts == 2);                       // Timeouts are retried
    assert(t.error->find("timed out") != std::string::npos);
    assert(result.duration_ms < 300);              // Stopped waiting, not working

    // Let abandoned attempts finish before the next test
    std::this_thread::sleep_for(std::chrono::milliseconds(350));

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_classifier() {
    std::cout << "Testing Scheduler retry classifier..." << std::endl;

    std::atomic<int> calls{0};
    auto fatal = std::make_shared<FunctionExecutable>("fatal", [&](const json&) -> json {
        calls++;
        throw FatalFailure("bad input");
    });

    auto config = fast_config();
    config.max_retries = 3;
    Scheduler scheduler(config);
    scheduler.set_retry_classifier(retry::transient_only);

    std::vector<Task> tasks;
    tasks.emplace_back(fatal);
    auto result = scheduler.run(std::move(tasks));
    assert(result.failed == 1);
    assert(result.tasks[0].attempts == 1);
    assert(calls.load() == 1);

    // Default classifier never retries cancellation
    std::atomic<int> cancelled_calls{0};
    auto cancelled = std::make_shared<FunctionExecutable>("cancelled", [&](const json&) -> json {
        cancelled_calls++;
        throw CancelledError();
    });
    Scheduler defaults(config);
    std::vector<Task> more;
    more.emplace_back(cancelled);
    auto r2 = defaults.run(std::move(more));
    assert(r2.failed == 1);
    assert(cancelled_calls.load() == 1);

    assert(retry::retry_all(std::make_exception_ptr(FatalFailure("x"))));
    assert(!retry::transient_only(std::make_exception_ptr(FatalFailure("x"))));
    assert(retry::transient_only(std::make_exception_ptr(TransientFailure("x"))));
    assert(retry::transient_only(std::make_exception_ptr(std::runtime_error("x"))));

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_callbacks_and_cancel() {
    std::cout << "Testing Scheduler callbacks and cancellation..." << std::endl;

    std::atomic<int> invoked{0};
    auto unit = std::make_shared<FunctionExecutable>("scout", [&](const json&) {
        invoked++;
        return json(1);
    }, "Scout");

    std::atomic<int> started{0};
    std::atomic<int> succeeded{0};
    Scheduler scheduler(fast_config());
    scheduler.on_task_start([&](const std::string& name) {
        assert(name == "Scout");
        started++;
        throw std::runtime_error("observer bug");    // Must not propagate
    });
    scheduler.on_task_complete([&](const std::string&, bool success) {
        if (success) succeeded++;
    });

    std::vector<Task> tasks;
    tasks.emplace_back(unit);
    tasks.emplace_back(unit);
    tasks.emplace_back(unit);
    assert(tasks[1].cancel());
    assert(!tasks[1].cancel());

    auto result = scheduler.run(std::move(tasks));
    assert(result.total == 3);
    assert(result.completed == 2);
    assert(result.cancelled == 1);
    assert(result.tasks[1].status == TaskStatus::Cancelled);
    assert(result.tasks[1].attempts == 0);
    assert(invoked.load() == 2);
    assert(started.load() == 2);
    assert(succeeded.load() == 2);

    Task done;
    done.status = TaskStatus::Completed;
    assert(!done.advance(TaskStatus::Running));
    assert(!done.cancel());

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_handoff_drain() {
    std::cout << "Testing Scheduler handoff drain..." << std::endl;

    HandoffQueue queue;
    auto orphan = queue.create("scout", "nobody", {}, HandoffPriority::Critical);
    auto later = queue.create("scout", "market", {}, HandoffPriority::Low);

    std::string filed_id;
    auto scout = std::make_shared<FunctionExecutable>("scout", [&](const json&) {
        HandoffContext ctx;
        ctx.reasoning = "pricing gap";
        ctx.suggested_actions = {"benchmark tiers"};
        filed_id = queue.create("scout", "market", ctx, HandoffPriority::High).id;
        return json("scouted");
    });

    std::mutex seen_mutex;
    std::vector<json> market_contexts;
    auto market = std::make_shared<FunctionExecutable>("market", [&](const json& ctx) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        market_contexts.push_back(ctx);
        return json("analyzed");
    });

    auto config = fast_config();
    config.max_concurrent = 1;        // scout runs before market
    Scheduler scheduler(config, &queue);

    std::vector<Task> tasks;
    tasks.emplace_back(scout);
    tasks.emplace_back(market);
    auto result = scheduler.run(std::move(tasks));

    assert(result.total == 3);
    assert(result.completed == 3);
    assert(result.tasks[2].id == "handoff-" + filed_id);
    assert(result.tasks[2].handoff.has_value());

    assert(market_contexts.size() == 2);
    bool saw_handoff = false;
    for (const auto& ctx : market_contexts) {
        if (ctx.contains("_handoff")) {
            saw_handoff = true;
            assert(ctx["_handoff"]["reasoning"] == "pricing gap");
            assert(ctx["_task_id"] == "handoff-" + filed_id);
        }
    }
    assert(saw_handoff);

    assert(queue.get(filed_id)->status == HandoffStatus::Completed);
    auto failed = queue.get(orphan.id);
    assert(failed->status == HandoffStatus::Failed);
    assert(failed->error == std::string("no executable for role nobody"));
    assert(queue.get(later.id)->status == HandoffStatus::Pending);   // Below HIGH

    auto grouped = Scheduler::collect_results(result.tasks);
    assert(grouped["market"].size() == 2);

    // Drain can be switched off
    auto quiet = fast_config();
    quiet.drain_handoffs = false;
    queue.create("ux", "market", {}, HandoffPriority::Critical);
    Scheduler no_drain(quiet, &queue);
    std::vector<Task> again;
    again.emplace_back(market);
    assert(no_drain.run(std::move(again)).total == 1);
    assert(queue.list_pending(std::nullopt, HandoffPriority::High).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_scheduler_foreign_exceptions() {
    std::cout << "Testing Scheduler non-standard exceptions..." << std::endl;

    auto wide = std::make_shared<FunctionExecutable>("scout", [](const json&) {
        std::string text;
        for (int i = 0; i < 100; ++i) text += "市";
        return json(text);
    });
    auto odd = std::make_shared<FunctionExecutable>("odd", [](const json&) -> json {
        throw 7;
    });

    Scheduler scheduler(fast_config());
    scheduler.on_task_start([](const std::string&) { throw 42; });
    scheduler.on_task_complete([](const std::string&, bool) { throw 42; });

    std::vector<Task> tasks;
    tasks.emplace_back(wide);
    tasks.emplace_back(odd);
    auto result = scheduler.run(std::move(tasks));
    assert(result.completed == 1);
    assert(result.failed == 1);
    assert(result.tasks[1].attempts == 2);
    assert(*result.tasks[1].error == "non-standard exception");

    // Summaries of long non-ASCII results stay valid UTF-8
    json j = result.tasks[0];
    std::string summary = j["result"].get<std::string>();
    assert(summary.size() == 199);                 // Quote + 66 whole characters
    assert(!j.dump().empty());

    // A classifier that throws fails the task instead of the worker
    Scheduler strict(fast_config());
    strict.set_retry_classifier([](const std::exception_ptr&) -> bool { throw 5; });
    std::vector<Task> more;
    more.emplace_back(std::make_shared<FunctionExecutable>("broken", [](const json&) -> json {
        throw std::runtime_error("bad gateway");
    }));
    more.emplace_back(wide);
    auto r2 = strict.run(std::move(more));
    assert(r2.failed == 1);
    assert(r2.completed == 1);
    assert(r2.tasks[0].status == TaskStatus::Failed);
    assert(*r2.tasks[0].error == "non-standard exception");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// KnowledgeStore
// ═══════════════════════════════════════════════════════════════════════════

void test_tag_index() {
    std::cout << "Testing SlotTagIndex..." << std::endl;

    SlotTagIndex index;
    index.set(0, {"pricing", "churn"});
    index.set(1, {"latency", "pricing", "pricing"});
    index.set(2, {"onboarding"});

    auto pricing = index.slots_with_any({"pricing"});
    assert((pricing == std::vector<uint32_t>{0, 1}));
    assert(index.slots_with_any({"churn", "onboarding"}).size() == 2);
    assert(index.slots_with_any({"unknown"}).empty());
    assert(index.slot_has_tag(1, "latency"));
    assert(index.tags_for_slot(1).size() == 2);
    assert(index.total_taggings() == 5);

    index.set(0, {"retention"});
    assert(!index.slot_has_tag(0, "pricing"));
    assert(index.slots_with_any({"pricing"}).size() == 1);

    index.remove_all(1);
    assert(index.slots_with_any({"pricing", "latency"}).empty());
    assert(index.tag_count() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_clamping() {
    std::cout << "Testing KnowledgeStore clamping..." << std::endl;

    KnowledgeStore store;
    auto b = store.add(make_basic("scout", "landing page", 1.7f));
    auto t = store.add(make_typed("market", Dimension::Market, SignalType::Risk,
                                  std::nanf(""), -0.3f));
    auto t2 = store.add(make_typed("market", Dimension::Market, SignalType::Need, 3.0f, 0.5f));

    assert(std::get<BasicRecord>(*b).quality_score == 1.0f);
    assert(std::get<TypedRecord>(*t).strength == 0.0f);
    assert(std::get<TypedRecord>(*t).confidence == 0.0f);
    assert(std::get<TypedRecord>(*t2).strength == 1.0f);

    for (const auto& r : store.all()) {
        RecordView v = view(*r);
        assert(v.weight >= 0.0f && v.weight <= 1.0f);
        if (const auto* typed = std::get_if<TypedRecord>(r.get())) {
            assert(typed->confidence >= 0.0f && typed->confidence <= 1.0f);
        }
    }

    assert(!spine(*b).id.empty());
    assert(spine(*b).timestamp > 0);
    assert(store.size() == 3);
    assert(store.basic_count() == 1);
    assert(store.typed_count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_pheromone_ranking() {
    std::cout << "Testing KnowledgeStore pheromone ranking..." << std::endl;

    KnowledgeStore store;
    auto a = store.add(make_basic("scout", "A", 0.5f));
    auto b = store.add(make_basic("scout", "B", 0.9f));
    const auto a_id = spine(*a).id;
    const auto b_id = spine(*b).id;

    for (int i = 0; i < 3; ++i) {
        store.add(make_basic("market", "cites A", 0.1f, {a_id}));
    }
    auto citer = store.add(make_basic("technical", "cites B", 0.1f, {b_id, "dangling-id"}));

    assert(store.pheromone(a_id)->reference_count == 3);
    assert(store.pheromone(b_id)->reference_count == 1);

    auto top = store.top_by_pheromone(2);
    assert(top.size() == 2);
    assert(spine(*top[0]).id == a_id);    // 3 x 0.5 beats 1 x 0.9
    assert(spine(*top[1]).id == b_id);

    auto hot = store.hot(1);
    assert(spine(*hot[0]).id == a_id);

    // Re-adding the same record does not count its citations twice
    BasicRecord again = std::get<BasicRecord>(*citer);
    store.add(again);
    assert(store.pheromone(b_id)->reference_count == 1);
    again.references.push_back(a_id);
    store.add(again);
    assert(store.pheromone(a_id)->reference_count == 4);
    assert(store.size() == 6);

    // get() touches the trail
    auto before = store.pheromone(a_id)->last_accessed;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    assert(store.get(a_id) != nullptr);
    assert(store.pheromone(a_id)->last_accessed > before);
    assert(store.get("missing") == nullptr);
    assert(!store.pheromone("missing").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_query() {
    std::cout << "Testing KnowledgeStore query..." << std::endl;

    KnowledgeStore store;
    auto t1 = store.add(make_typed("market", Dimension::Market, SignalType::Risk, 0.8f, 0.9f,
                                   {"pricing", "churn"}));
    auto t2 = store.add(make_typed("technical", Dimension::Technical, SignalType::Insight,
                                   0.6f, 0.4f, {"latency"}));
    auto b1 = store.add(make_basic("market", "pricing page changed", 0.7f, {spine(*t2).id}));

    BasicRecord old = make_basic("scout", "stale note", 0.2f);
    old.timestamp = now() - 48 * MS_PER_HOUR;
    store.add(old);

    RecordFilter all;
    assert(store.query(all).size() == 4);
    assert(store.query(all, 2).size() == 2);
    assert(spine(*store.query(all, 1)[0]).id == spine(*t2).id);   // Only cited record

    RecordFilter by_dim;
    by_dim.dimensions = {Dimension::Market};
    auto market = store.query(by_dim);
    assert(market.size() == 1);
    assert(spine(*market[0]).id == spine(*t1).id);

    RecordFilter by_tag;
    by_tag.tags = {"churn", "latency"};
    assert(store.query(by_tag).size() == 2);
    by_tag.tags = {"unknown"};
    assert(store.query(by_tag).empty());

    RecordFilter by_role;
    by_role.producer_roles = {"market"};
    assert(store.query(by_role).size() == 2);

    RecordFilter quality;
    quality.min_quality = 0.5f;
    auto good = store.query(quality);
    assert(good.size() == 1);
    assert(spine(*good[0]).id == spine(*b1).id);

    RecordFilter recent;
    recent.max_age_hours = 24;
    assert(store.query(recent).size() == 3);

    RecordFilter confident;
    confident.min_confidence = 0.5f;
    assert(store.query(confident).size() == 1);

    RecordFilter verified;
    verified.verified_only = true;
    assert(store.query(verified).empty());
    assert(store.verify(spine(*t2).id, "blue_team") != nullptr);
    assert(store.query(verified).size() == 1);

    assert(store.by_producer("market").size() == 2);
    assert(store.fresh(24, 10).size() == 3);

    auto dims = store.aggregate_by_dimension();
    assert(dims.size() == 2);
    assert(dims[Dimension::Market].size() == 1);
    auto types = store.aggregate_by_type();
    assert(types[SignalType::Insight].size() == 1);

    auto insights = store.cross_producer_insights();
    assert(insights.size() == 1);
    assert(insights[0].record_id == spine(*t2).id);
    assert(insights[0].from_role == "technical");
    assert((insights[0].referenced_by == std::vector<std::string>{"market"}));
    assert(insights[0].dimension == Dimension::Technical);

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_related() {
    std::cout << "Testing KnowledgeStore related..." << std::endl;

    KnowledgeStore store;
    auto d = store.add(make_basic("scout", "D", 0.4f));
    auto c = store.add(make_basic("scout", "C", 0.9f, {spine(*d).id}));
    auto b = store.add(make_basic("scout", "B", 0.3f, {spine(*c).id}));
    auto a = store.add(make_basic("scout", "A", 0.5f, {spine(*b).id}));

    auto two = store.related(spine(*a).id, 2);
    assert(two.size() == 2);
    assert(spine(*two[0]).id == spine(*c).id);        // Ranked by weight
    assert(spine(*two[1]).id == spine(*b).id);

    auto three = store.related(spine(*a).id, 3);
    assert(three.size() == 3);
    for (const auto& r : three) assert(spine(*r).id != spine(*a).id);

    assert(store.related(spine(*a).id, 3, 1).size() == 1);
    assert(store.related(spine(*d).id, 2).empty());
    assert(store.related("missing", 2).empty());

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_verify() {
    std::cout << "Testing KnowledgeStore verify..." << std::endl;

    KnowledgeStore store;
    auto t = store.add(make_typed("red_team", Dimension::Business, SignalType::Threat, 0.4f, 0.6f));
    auto b = store.add(make_basic("scout", "note", 0.5f));

    auto v = store.verify(spine(*t).id, "blue_team", "confirmed by pricing page", 1.5f);
    assert(v != nullptr);
    const auto& verified = std::get<TypedRecord>(*v);
    assert(verified.verified);
    assert(verified.strength == 1.0f);
    assert(verified.debate_points.size() == 1);
    assert(verified.debate_points[0] == "confirmed by pricing page");
    assert(verified.metadata.at("verified_by") == "blue_team");

    // Readers holding the old value see it unchanged
    assert(!std::get<TypedRecord>(*t).verified);
    assert(std::get<TypedRecord>(*store.get(spine(*t).id)).verified);

    assert(store.verify(spine(*b).id, "blue_team") == nullptr);
    assert(store.verify("missing", "blue_team") == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_persistence() {
    std::cout << "Testing KnowledgeStore persistence..." << std::endl;

    const std::string path = "/tmp/hive_test_store/environment.json";
    std::remove(path.c_str());

    KnowledgeStore store;
    auto t = store.add(make_typed("market", Dimension::Market, SignalType::Opportunity, 0.7f, 0.8f,
                                  {"pricing"}));
    auto b = store.add(make_basic("scout", "homepage", 0.6f, {spine(*t).id}));
    store.add(make_basic("technical", "api docs", 0.5f, {spine(*t).id, spine(*b).id}));

    std::set<std::string> ids;
    for (const auto& r : store.all()) ids.insert(spine(*r).id);
    uint32_t t_refs = store.pheromone(spine(*t).id)->reference_count;
    uint32_t b_refs = store.pheromone(spine(*b).id)->reference_count;
    assert(t_refs == 2);
    assert(b_refs == 1);

    assert(store.persist(path));
    store.clear();
    assert(store.size() == 0);

    assert(store.restore(path));
    assert(store.size() == 3);
    assert(store.basic_count() == 2);
    assert(store.typed_count() == 1);

    std::set<std::string> restored;
    for (const auto& r : store.all()) restored.insert(spine(*r).id);
    assert(restored == ids);
    assert(store.pheromone(spine(*t).id)->reference_count == t_refs);
    assert(store.pheromone(spine(*b).id)->reference_count == b_refs);

    RecordFilter by_tag;
    by_tag.tags = {"pricing"};
    assert(store.query(by_tag).size() == 1);

    auto text = read_text(path);
    assert(text.has_value());
    json doc = json::parse(*text);
    assert(doc.contains("basic_records"));
    assert(doc.contains("typed_records"));
    assert(doc.contains("pheromones"));
    assert(doc.contains("version"));
    assert(doc.contains("timestamp"));

    // A corrupt snapshot leaves the store untouched
    const std::string bad = "/tmp/hive_test_store/corrupt.json";
    assert(safe_save_text(bad, "{\"version\": \"1.0\", \"basic_records\": [{\"id\": 3"));
    assert(!store.restore(bad));
    assert(store.size() == 3);
    assert(!store.restore("/tmp/hive_test_store/missing.json"));

    // Snapshots from a newer major version are refused
    doc["version"] = "2.0";
    assert(safe_save_text(bad, doc.dump()));
    assert(!store.restore(bad));
    assert(store.size() == 3);

    std::remove(path.c_str());
    std::remove(bad.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Retrieval
// ═══════════════════════════════════════════════════════════════════════════

void test_url_dedup() {
    std::cout << "Testing ResultAggregator dedup..." << std::endl;

    assert(normalize_url("HTTP://Example.com/a?x=1&utm_medium=y&fbclid=z#frag") ==
           "https://example.com/a?x=1");
    assert(normalize_url("https://example.com/a?gclid=1") == "https://example.com/a");
    assert(normalize_url("example.com/path") == "https://example.com/path");

    ProviderResults gathered = {
        {"tavily", {make_result("https://example.com/a?utm_source=news", 0.4f),
                    make_result("https://example.com/b", 0.5f)}},
        {"ddg", {make_result("http://Example.com/a", 0.9f)}}
    };

    ResultAggregator merger;
    auto merged = merger.aggregate(gathered, 10);
    assert(merged.total_count == 3);
    assert(merged.deduped_count == 2);
    assert(merged.provider_counts["tavily"] == 2);
    assert(merged.results.size() == 2);
    assert(merged.results[0].score == 0.9f);
    assert(merged.results[0].provider == "ddg");

    ResultAggregator keep_all(false);
    assert(keep_all.aggregate(gathered, 10).results.size() == 3);
    assert(merger.aggregate(gathered, 1).results.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_sort_strategies() {
    std::cout << "Testing ResultAggregator sort strategies..." << std::endl;

    ProviderResults gathered = {
        {"a", {make_result("https://a.com/1", 0.9f, "2024-01-01"),
               make_result("https://a.com/2", 0.8f),
               make_result("https://a.com/3", 0.7f, "2024-06-01")}},
        {"b", {make_result("https://b.com/1", 0.5f, "2023-05-05"),
               make_result("https://b.com/2", 0.95f)}}
    };

    auto latest = ResultAggregator(true, SortStrategy::Latest).aggregate(gathered, 10).results;
    assert(latest.size() == 5);
    assert(latest[0].url == "https://a.com/3");
    assert(latest[1].url == "https://a.com/1");
    assert(latest[2].url == "https://b.com/1");
    assert(latest[3].published_date.empty());

    auto diverse = ResultAggregator(true, SortStrategy::Diverse).aggregate(gathered, 10).results;
    assert(diverse.size() == 5);
    assert(diverse[0].url == "https://a.com/1");
    assert(diverse[1].url == "https://b.com/2");
    assert(diverse[2].url == "https://a.com/2");
    assert(diverse[3].url == "https://b.com/1");
    assert(diverse[4].url == "https://a.com/3");

    auto by_score = ResultAggregator().aggregate(gathered, 2).results;
    assert(by_score[0].url == "https://b.com/2");
    assert(by_score[1].url == "https://a.com/1");

    std::cout << "  PASS" << std::endl;
}

void test_quota_daily() {
    std::cout << "Testing QuotaManager daily quota..." << std::endl;

    const std::string path = "/tmp/hive_test_quota/quota.json";
    std::remove(path.c_str());

    QuotaConfig config;
    config.path = path;
    Timestamp t = now();

    {
        QuotaManager quota(config);
        quota.set_clock([&t] { return t; });
        quota.configure_provider("tavily", 3, std::nullopt);
        assert(quota.check_and_consume("tavily"));
        assert(quota.check_and_consume("tavily", 2));
        assert(!quota.check_and_consume("tavily"));
        assert(quota.check_and_consume("ddg"));         // Unlimited

        auto status = quota.status("tavily");
        assert(status.daily_used == 3);
        assert(status.daily_remaining == 0);
        assert(status.reset_date == local_date(t));
        assert(quota.all_status().size() == 2);
    }

    {
        // A fresh process sees the same denial
        QuotaManager quota(config);
        quota.set_clock([&t] { return t; });
        assert(!quota.check_and_consume("tavily"));

        // Next calendar day
        t += 36 * MS_PER_HOUR;
        assert(quota.check_and_consume("tavily"));
        assert(quota.status("tavily").daily_used == 1);

        quota.reset_daily("tavily");
        assert(quota.status("tavily").daily_used == 0);
    }

    auto text = read_text(path);
    assert(text.has_value());
    json doc = json::parse(*text);
    assert(doc["version"] == HIVE_QUOTA_FILE_VERSION);
    assert(doc["providers"]["tavily"]["daily_limit"] == 3);
    assert(doc["providers"]["ddg"]["daily_limit"].is_null());

    QuotaConfig off;
    off.enabled = false;
    off.path = "";
    QuotaManager disabled(off);
    disabled.configure_provider("tavily", 0, 0);
    assert(disabled.check_and_consume("tavily"));

    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_quota_rate_window() {
    std::cout << "Testing QuotaManager rate window..." << std::endl;

    QuotaManager quota(memory_quota());
    Timestamp t = now();
    quota.set_clock([&t] { return t; });
    quota.configure_provider("ddg", std::nullopt, 2);

    assert(quota.check_and_consume("ddg"));
    assert(quota.check_and_consume("ddg"));
    assert(!quota.check_and_consume("ddg"));
    assert(quota.status("ddg").rate_window_used == 2);

    t += 61 * MS_PER_SECOND;
    assert(quota.check_and_consume("ddg"));
    assert(quota.status("ddg").rate_window_used == 1);

    quota.reset_rate_window();
    assert(quota.status("ddg").rate_window_used == 0);
    assert(quota.check_and_consume("ddg"));

    // Non-positive costs are refused and never refund
    assert(!quota.check_and_consume("ddg", 0));
    assert(!quota.check_and_consume("ddg", -3));
    assert(quota.status("ddg").rate_window_used == 1);
    assert(quota.status("ddg").daily_used == 4);

    std::cout << "  PASS" << std::endl;
}

void test_search_cache() {
    std::cout << "Testing SearchCache..." << std::endl;

    assert(SearchCache::fingerprint("q", TimeRange::OneYear, 10) ==
           SearchCache::fingerprint("q", TimeRange::OneYear, 10));
    assert(SearchCache::fingerprint("q", TimeRange::OneYear, 10) !=
           SearchCache::fingerprint("q", TimeRange::OneWeek, 10));
    assert(SearchCache::fingerprint("q", TimeRange::OneYear, 10).size() == 16);

    const std::string path = "/tmp/hive_test_cache/search.db";
    std::remove(path.c_str());

    CacheConfig config;
    config.path = path;
    config.ttl_seconds = 3600;

    {
        SearchCache cache(config);
        assert(cache.persistent());
        cache.set("saas pricing", {make_result("https://a.com", 0.7f)}, TimeRange::OneYear, 10);
        assert(cache.get("saas pricing", TimeRange::OneYear, 10).has_value());
        assert(!cache.get("saas pricing", TimeRange::OneYear, 5).has_value());
    }

    {
        // Survives a restart
        SearchCache cache(config);
        auto hit = cache.get("saas pricing", TimeRange::OneYear, 10);
        assert(hit.has_value());
        assert(hit->size() == 1);
        assert((*hit)[0].url == "https://a.com");

        Timestamp t = now();
        cache.set_clock([&t] { return t; });
        cache.set("short lived", {make_result("https://b.com", 0.1f)}, TimeRange::OneDay, 10, 1);
        assert(cache.stats().entries == 2);
        t += 2 * MS_PER_SECOND;
        assert(cache.stats().expired == 1);
        assert(cache.cleanup_expired() == 1);
        assert(cache.size() == 1);

        assert(cache.invalidate("saas pricing", TimeRange::OneYear, 10));
        assert(!cache.invalidate("saas pricing", TimeRange::OneYear, 10));
    }

    {
        SearchCache cache(config);
        assert(cache.size() == 0);
        cache.set("x", {}, TimeRange::OneYear, 10);
        cache.clear();
        assert(cache.size() == 0);
    }

    SearchCache off(memory_cache(false));
    off.set("x", {make_result("https://c.com", 0.1f)}, TimeRange::OneYear, 10);
    assert(!off.get("x", TimeRange::OneYear, 10).has_value());
    assert(!off.stats().enabled);

    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_provider_registry() {
    std::cout << "Testing ProviderRegistry..." << std::endl;

    ProviderRegistry registry;
    int built = 0;
    registry.register_provider("tavily", [&built]() {
        built++;
        return std::make_shared<FakeProvider>("tavily", 10, std::vector<SearchResult>{});
    });
    registry.register_provider("broken", []() -> std::shared_ptr<SearchProvider> {
        throw std::runtime_error("missing api key");
    });

    auto p1 = registry.get("tavily");
    auto p2 = registry.get("tavily");
    assert(p1 != nullptr);
    assert(p1 == p2);
    assert(built == 1);

    auto p3 = registry.get("tavily", true);
    assert(p3 != p1);
    assert(registry.get("tavily") == p3);        // force_new replaces the cached one
    assert(built == 2);

    assert(registry.get("broken") == nullptr);
    assert(registry.get("missing") == nullptr);

    auto health = registry.list_with_health();
    assert(health["tavily"]);
    assert(!health["broken"]);
    assert((registry.list() == std::vector<std::string>{"broken", "tavily"}));

    assert(registry.unregister("tavily"));
    assert(!registry.unregister("tavily"));
    assert(registry.get("tavily") == nullptr);

    registry.clear();
    assert(registry.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_aggregator_cache_ttl() {
    std::cout << "Testing RetrievalAggregator cache TTL..." << std::endl;

    auto provider = std::make_shared<FakeProvider>("tavily", 10, std::vector<SearchResult>{
        make_result("https://a.com/1", 0.9f)});
    ProviderRegistry registry;
    registry.register_provider("tavily", [provider]() { return provider; });

    SearchCache cache(memory_cache());
    Timestamp t = now();
    cache.set_clock([&t] { return t; });
    QuotaManager quota(memory_quota());
    RetrievalAggregator aggregator(registry, cache, quota);

    assert(aggregator.search("crm tools", TimeRange::OneYear, 10).size() == 1);
    assert(provider->calls.load() == 1);
    assert(aggregator.search("crm tools", TimeRange::OneYear, 10).size() == 1);
    assert(provider->calls.load() == 1);           // Served from cache

    t += 3601 * MS_PER_SECOND;
    assert(aggregator.search("crm tools", TimeRange::OneYear, 10).size() == 1);
    assert(provider->calls.load() == 2);

    // Empty answers are not cached
    provider->empty = true;
    assert(aggregator.search("nothing here", TimeRange::OneYear, 10).empty());
    assert(aggregator.search("nothing here", TimeRange::OneYear, 10).empty());
    assert(provider->calls.load() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_aggregator_modes() {
    std::cout << "Testing RetrievalAggregator modes..." << std::endl;

    auto high = std::make_shared<FakeProvider>("high", 5, std::vector<SearchResult>{
        make_result("https://high.com/1", 0.5f)});
    auto mid = std::make_shared<FakeProvider>("mid", 3, std::vector<SearchResult>{
        make_result("https://mid.com/1", 0.7f)});
    auto low = std::make_shared<FakeProvider>("low", 1, std::vector<SearchResult>{
        make_result("https://low.com/1", 0.9f)});

    ProviderRegistry registry;
    registry.register_provider("low", [low]() { return low; });
    registry.register_provider("mid", [mid]() { return mid; });
    registry.register_provider("high", [high]() { return high; });

    SearchCache cache(memory_cache(false));
    QuotaManager quota(memory_quota());

    auto reset = [&]() {
        high->calls = 0; mid->calls = 0; low->calls = 0;
        high->throws = false; high->empty = false; high->healthy = true;
    };

    // Priority: first non-empty in descending priority
    {
        RetrievalAggregator aggregator(registry, cache, quota);
        auto res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res.size() == 1);
        assert(res[0].provider == "high");
        assert(mid->calls.load() == 0 && low->calls.load() == 0);

        reset();
        high->empty = true;
        res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res[0].provider == "mid");
        assert(high->calls.load() == 1);

        reset();
        high->throws = true;
        res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res[0].provider == "mid");

        reset();
        high->healthy = false;
        res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res[0].provider == "mid");
        assert(high->calls.load() == 0);

        assert(aggregator.metadata().name == "multi");
        assert(aggregator.health_check());
        reset();
    }

    // Parallel: up to K providers
    {
        RetrievalConfig config;
        config.mode = AggregationMode::Parallel;
        config.max_parallel_providers = 2;
        RetrievalAggregator aggregator(registry, cache, quota, config);
        auto res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res.size() == 2);
        assert(low->calls.load() == 0);
        assert(res[0].provider == "mid");          // Higher score first
        reset();
    }

    // All: every healthy provider
    {
        RetrievalConfig config;
        config.mode = AggregationMode::All;
        RetrievalAggregator aggregator(registry, cache, quota, config);
        auto res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res.size() == 3);
        assert(high->calls.load() == 1 && mid->calls.load() == 1 && low->calls.load() == 1);

        // Everything failing yields an empty list
        reset();
        high->throws = true;
        mid->empty = true;
        low->healthy = false;
        assert(aggregator.search("q", TimeRange::OneYear, 10).empty());
        mid->empty = false;
        low->healthy = true;
        reset();
    }

    // Config priorities override advertised ones; disabled providers are skipped
    {
        RetrievalConfig config;
        config.providers["low"].priority = 50;
        config.providers["high"].enabled = false;
        RetrievalAggregator aggregator(registry, cache, quota, config);
        auto res = aggregator.search("q", TimeRange::OneYear, 10);
        assert(res[0].provider == "low");
        assert(high->calls.load() == 0);
        reset();
    }

    // Quota denial skips the provider
    {
        QuotaManager tight(memory_quota());
        RetrievalConfig config;
        config.providers["high"].daily_quota = 1;
        RetrievalAggregator aggregator(registry, cache, tight, config);
        assert(aggregator.search("q", TimeRange::OneYear, 10)[0].provider == "high");
        assert(aggregator.search("q", TimeRange::OneYear, 10)[0].provider == "mid");
        assert(high->calls.load() == 1);
        assert(aggregator.quota_status().at("high").daily_used == 1);
        reset();
    }

    // Role profiles
    {
        RetrievalConfig config;
        SearchProfile scout;
        scout.preferred_providers = {"low"};
        scout.max_results = 1;
        config.profiles["scout"] = scout;
        RetrievalAggregator aggregator(registry, cache, quota, config);
        auto res = aggregator.search_as("scout", "q");
        assert(res.size() == 1);
        assert(res[0].provider == "low");
        assert(high->calls.load() == 0);

        auto fallback = aggregator.search_as("unknown-role", "q");
        assert(fallback[0].provider == "high");
    }

    std::cout << "  PASS" << std::endl;
}

void test_insight_excerpt() {
    std::cout << "Testing KnowledgeStore insight excerpts..." << std::endl;

    KnowledgeStore store;
    TypedRecord finding = make_typed("technical", Dimension::Technical, SignalType::Insight, 0.7f, 0.7f);
    finding.evidence.clear();
    for (int i = 0; i < 60; ++i) finding.evidence += "市";
    auto t = store.add(finding);
    store.add(make_basic("market", "builds on it", 0.5f, {spine(*t).id}));

    auto insights = store.cross_producer_insights();
    assert(insights.size() == 1);
    assert(insights[0].excerpt.size() == 102);     // 33 whole characters + "..."
    json j = insights[0].excerpt;
    assert(!j.dump().empty());

    std::cout << "  PASS" << std::endl;
}

void test_aggregator_foreign_exceptions() {
    std::cout << "Testing RetrievalAggregator non-standard exceptions..." << std::endl;

    auto boom = std::make_shared<FakeProvider>("boom", 9, std::vector<SearchResult>{
        make_result("https://boom.com/1", 0.9f)});
    boom->throws_foreign = true;
    auto sick = std::make_shared<FakeProvider>("sick", 8, std::vector<SearchResult>{
        make_result("https://sick.com/1", 0.9f)});
    sick->health_throws = true;
    auto good = std::make_shared<FakeProvider>("good", 1, std::vector<SearchResult>{
        make_result("https://good.com/1", 0.5f)});

    ProviderRegistry registry;
    registry.register_provider("boom", [boom]() { return boom; });
    registry.register_provider("sick", [sick]() { return sick; });
    registry.register_provider("good", [good]() { return good; });
    registry.register_provider("odd", []() -> std::shared_ptr<SearchProvider> { throw 3; });

    SearchCache cache(memory_cache(false));
    QuotaManager quota(memory_quota());

    RetrievalAggregator aggregator(registry, cache, quota);
    auto res = aggregator.search("q", TimeRange::OneYear, 10);
    assert(res.size() == 1);
    assert(res[0].provider == "good");
    assert(boom->calls.load() == 1);
    assert(sick->calls.load() == 0);

    RetrievalConfig all;
    all.mode = AggregationMode::All;
    RetrievalAggregator fan(registry, cache, quota, all);
    res = fan.search("q", TimeRange::OneYear, 10);
    assert(res.size() == 1);
    assert(res[0].provider == "good");

    assert(registry.get("odd") == nullptr);
    auto health = registry.list_with_health();
    assert(!health["odd"]);
    assert(!health["sick"]);
    assert(health["good"]);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_writers() {
    std::cout << "Testing concurrent writers..." << std::endl;

    const int N = 16;
    std::vector<std::thread> threads;

    // Citations from parallel producers all land
    KnowledgeStore store;
    auto target = store.add(make_basic("scout", "shared finding", 0.8f));
    const std::string target_id = spine(*target).id;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&store, &target_id, i]() {
            store.add(make_basic("worker-" + std::to_string(i), "builds on it", 0.5f, {target_id}));
        });
    }
    for (auto& th : threads) th.join();
    threads.clear();
    assert(store.pheromone(target_id)->reference_count == static_cast<uint32_t>(N));
    assert(store.size() == static_cast<size_t>(N) + 1);

    // Exactly daily_limit grants under contention
    QuotaManager quota(memory_quota());
    quota.configure_provider("tavily", 5, std::nullopt);
    std::atomic<int> granted{0};
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&quota, &granted]() {
            if (quota.check_and_consume("tavily")) granted++;
        });
    }
    for (auto& th : threads) th.join();
    threads.clear();
    assert(granted.load() == 5);
    assert(quota.status("tavily").daily_used == 5);

    // Sequence numbers stay unique and dense
    HandoffQueue queue;
    std::mutex seq_mutex;
    std::vector<uint64_t> sequences;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&queue, &seq_mutex, &sequences]() {
            for (int k = 0; k < 10; ++k) {
                auto h = queue.create("scout", "market", {});
                std::lock_guard<std::mutex> lock(seq_mutex);
                sequences.push_back(h.sequence);
            }
        });
    }
    for (auto& th : threads) th.join();
    threads.clear();
    std::sort(sequences.begin(), sequences.end());
    assert(sequences.size() == static_cast<size_t>(N) * 10);
    for (size_t i = 0; i < sequences.size(); ++i) assert(sequences[i] == i);
    auto pending = queue.list_pending();
    for (size_t i = 1; i < pending.size(); ++i) {
        assert(pending[i - 1].sequence < pending[i].sequence);
    }

    // Parallel cache writes
    SearchCache cache(memory_cache());
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&cache, i]() {
            cache.set("query " + std::to_string(i), {make_result("https://a.com", 0.5f)},
                      TimeRange::OneYear, 10);
        });
    }
    for (auto& th : threads) th.join();
    threads.clear();
    assert(cache.size() == static_cast<size_t>(N));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Hive C++ Tests ===" << std::endl;
    std::cout << "HIVE_VERSION = " << HIVE_VERSION << std::endl;
    std::cout << std::endl;

    test_types();
    test_config();

    test_handoff_ordering();
    test_handoff_state_machine();

    test_scheduler_basic();
    test_scheduler_concurrency_cap();
    test_scheduler_retry();
    test_scheduler_timeout();
    test_scheduler_classifier();
    test_scheduler_callbacks_and_cancel();
    test_scheduler_handoff_drain();
    test_scheduler_foreign_exceptions();

    std::cout << std::endl;
    std::cout << "=== Knowledge Tests ===" << std::endl;
    test_tag_index();
    test_knowledge_clamping();
    test_pheromone_ranking();
    test_knowledge_query();
    test_knowledge_related();
    test_knowledge_verify();
    test_knowledge_persistence();
    test_insight_excerpt();

    std::cout << std::endl;
    std::cout << "=== Retrieval Tests ===" << std::endl;
    test_url_dedup();
    test_sort_strategies();
    test_quota_daily();
    test_quota_rate_window();
    test_search_cache();
    test_provider_registry();
    test_aggregator_cache_ttl();
    test_aggregator_modes();
    test_aggregator_foreign_exceptions();

    std::cout << std::endl;
    std::cout << "=== Concurrency Tests ===" << std::endl;
    test_concurrent_writers();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
