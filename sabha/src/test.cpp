#include <sabha/sabha.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <thread>
#include <chrono>

using namespace sabha;

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

constexpr size_t DIM = 64;

std::string temp_dir() {
    char tmpl[] = "/tmp/sabha_test_XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

void remove_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

std::vector<float> test_vector(float seed, size_t dim = DIM) {
    std::vector<float> v(dim);
    for (size_t i = 0; i < dim; ++i) {
        v[i] = std::sin((static_cast<float>(i) + seed) * 0.1f);
    }
    normalize(v);
    return v;
}

MemoryStoreConfig store_config(const std::string& dir) {
    MemoryStoreConfig c;
    c.dir = dir;
    c.dimension = DIM;
    return c;
}

EmbedderConfig embedder_config() {
    EmbedderConfig c;
    c.dimension = DIM;
    return c;
}

MemoryRecord make_record(float seed, EventKind kind = EventKind::Signal,
                         const std::string& symbol = "AAPL") {
    MemoryRecord r;
    r.vector = test_vector(seed);
    r.summary = "signal from alpha buy " + symbol;
    r.agent_id = "alpha";
    r.kind = kind;
    r.importance = 0.6f;
    r.created = now();
    r.symbol = symbol;
    r.payload.tags = {"momentum"};
    r.payload.numbers["rsi"] = 61.5;
    return r;
}

Event signal_event(const std::string& agent, const std::string& symbol, float confidence) {
    Event e;
    e.kind = EventKind::Signal;
    e.agent_id = agent;
    e.category = AgentCategory::SignalGeneration;
    e.ref_id = "sig-" + agent;
    e.symbol = symbol;
    e.action = Action::Buy;
    e.confidence = confidence;
    e.risk = 0.3f;
    return e;
}

json step(const std::string& symbol, const std::string& action, double confidence,
          double risk = 0.2, int delay_ms = 0) {
    json j = json::object();
    j["symbol"] = symbol;
    j["action"] = action;
    j["confidence"] = confidence;
    j["risk"] = risk;
    if (delay_ms > 0) j["delay_ms"] = delay_ms;
    return j;
}

json fail_step() {
    json j = json::object();
    j["fail"] = true;
    return j;
}

AgentSpec scripted(const std::string& id, AgentRole role, float weight,
                   std::vector<json> steps = {}) {
    AgentSpec spec;
    spec.id = id;
    spec.role = role;
    spec.weight = weight;
    spec.options = json::object();
    if (!steps.empty()) spec.options["script"] = steps;
    return spec;
}

bool near(double a, double b, double eps = 1e-4) { return std::fabs(a - b) <= eps; }

// Waits for a condition another thread will make true
template<typename F>
bool eventually(F&& condition, int timeout_ms = 1000) {
    auto until = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (Clock::now() < until) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// A whole council wired by hand, so tests can reach every component
struct Rig {
    std::string dir;
    MemoryStore store;
    Embedder embedder;
    AgentSupervisor supervisor;
    OutputRouter output;
    InputRouter input;
    Coordinator coordinator;
    CoordinationState state;
    std::map<std::string, std::shared_ptr<AgentTrace>> traces;

    Rig(const std::vector<AgentSpec>& specs, CoordinatorConfig cc = {})
        : dir(temp_dir()),
          store(store_config(dir)),
          embedder(embedder_config()),
          supervisor(2),
          output(OutputRouterConfig{}, embedder, store, &supervisor),
          input(InputRouterConfig{}, embedder, store),
          coordinator(std::move(cc), supervisor, output, &input)
    {
        bool opened = store.open();
        assert(opened);
        embedder.attach(&store);
        output.set_significance(COORDINATOR_ID, 1.0f);

        AgentDeps deps;
        deps.input = &input;
        for (const auto& spec : specs) {
            output.set_significance(spec.id, spec.significance);
            if (!spec.interests.empty()) output.subscribe({spec.id, spec.interests});
            auto agent = make_agent(spec, deps);
            traces[spec.id] = agent->trace();
            supervisor.add(std::move(agent));
        }
        supervisor.start();
        state = Coordinator::initial_state(specs);
    }

    ~Rig() {
        supervisor.stop();
        store.close();
        remove_dir(dir);
    }

    const AgentState& agent(const std::string& id) const { return state.agents.at(id); }
};

CoordinatorConfig fast_config() {
    CoordinatorConfig c;
    c.agent_timeout = std::chrono::milliseconds(100);
    c.tick_deadline = std::chrono::milliseconds(1000);
    c.watchlist = {"AAPL"};
    return c;
}

// ═══════════════════════════════════════════════════════════════════════════
// Types and roles
// ═══════════════════════════════════════════════════════════════════════════

void test_record_id() {
    std::cout << "Testing RecordId..." << std::endl;

    RecordId id = RecordId::generate();
    assert(!id.nil());
    auto parsed = RecordId::parse(id.to_string());
    assert(parsed.has_value());
    assert(*parsed == id);
    assert(!RecordId::parse("not-an-id").has_value());
    assert(RecordId::generate() != id);

    std::cout << "  PASS" << std::endl;
}

void test_roles() {
    std::cout << "Testing role registry..." << std::endl;

    assert(all_roles().size() == 15);
    std::set<std::string> names;
    for (AgentRole r : all_roles()) {
        names.insert(role_name(r));
        assert(parse_role(role_name(r)) == r);
    }
    assert(names.size() == 15);
    assert(!parse_role("oracle").has_value());

    assert(role_category(AgentRole::PennyScanner) == AgentCategory::SignalGeneration);
    assert(role_category(AgentRole::MarketTiming) == AgentCategory::Timing);
    assert(role_category(AgentRole::RuleSet) == AgentCategory::RuleValidation);
    assert(role_category(AgentRole::TaxEstimator) == AgentCategory::Risk);
    assert(role_category(AgentRole::KalshiTrader) == AgentCategory::Execution);
    assert(role_category(AgentRole::MemoryAgent) == AgentCategory::Memory);
    assert(role_category(AgentRole::MarketData) == AgentCategory::Service);
    assert(role_category(AgentRole::StrategyManager) == AgentCategory::Coordination);

    assert(votes_in_consensus(AgentCategory::SignalGeneration));
    assert(!votes_in_consensus(AgentCategory::Risk));
    assert(!votes_in_consensus(AgentCategory::Execution));

    std::cout << "  PASS" << std::endl;
}

void test_make_agent_all_roles() {
    std::cout << "Testing agent factory over every role..." << std::endl;

    for (AgentRole r : all_roles()) {
        AgentSpec spec;
        spec.id = role_name(r);
        spec.role = r;
        spec.options = json::object();
        auto agent = make_agent(spec);
        assert(agent->role() == r);
        assert(agent->category() == role_category(r));
        assert(agent->healthy());

        TickContext ctx;
        ctx.tick_id = 1;
        ctx.watchlist = {"AAPL"};
        // Without a script, options or memory every reference agent abstains
        assert(!agent->produce_signal(ctx).has_value());
        assert(agent->trace()->polls() == 1);
    }

    AgentSpec bad = scripted("bad", AgentRole::Strategy, 1.0f);
    json broken = json::object();
    broken["action"] = "short";
    bad.options["script"] = json::array({broken});
    bool threw = false;
    try {
        make_agent(bad);
    } catch (const ConfigurationError& e) {
        threw = std::string(e.what()).find("agents.bad.script[0]") != std::string::npos;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Embedder
// ═══════════════════════════════════════════════════════════════════════════

class BrokenBackend : public EmbeddingBackend {
public:
    std::vector<float> embed(const std::string&) override {
        throw DegradedDependencyError("model server unreachable");
    }
    size_t dimension() const override { return DIM; }
    bool ready() const override { return true; }
    std::string name() const override { return "broken"; }
};

class CountingBackend : public EmbeddingBackend {
public:
    std::vector<float> embed(const std::string& text) override {
        ++calls;
        return test_vector(static_cast<float>(text.size()));
    }
    size_t dimension() const override { return DIM; }
    bool ready() const override { return true; }
    std::string name() const override { return "counting"; }

    int calls = 0;
};

void test_text_preprocessing() {
    std::cout << "Testing text preprocessing and summaries..." << std::endl;

    TextPreprocessor pre;
    assert(pre.clean("  Buy\tAAPL \n now ") == "buy aapl now");
    assert(pre.clean("   ").empty());

    Event e;
    e.kind = EventKind::Decision;
    e.agent_id = "coordinator";
    e.symbol = "MSFT";
    e.action = Action::Sell;
    e.confidence = 0.7f;
    e.verdict = Verdict::Approved;
    std::string s = summarize(e);
    assert(!s.empty());
    assert(s.find("msft") != std::string::npos);
    assert(s.find("0.70") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_hash_backend() {
    std::cout << "Testing hash embedding backend..." << std::endl;

    HashBackend h(DIM);
    auto a = h.embed("buy aapl momentum breakout");
    auto b = h.embed("buy aapl momentum breakout");
    auto c = h.embed("sell tsla earnings miss");
    assert(a.size() == DIM);
    assert(a == b);

    float norm = 0.0f;
    for (float x : a) norm += x * x;
    assert(near(norm, 1.0, 1e-4));

    auto near_text = h.embed("buy aapl momentum");
    assert(cosine(a, near_text) > cosine(a, c));

    std::cout << "  PASS" << std::endl;
}

void test_embedder_fallback() {
    std::cout << "Testing embedder fallback..." << std::endl;

    LogCapture capture;
    set_log_sink(capture.sink());

    Embedder embedder(embedder_config(), std::make_unique<BrokenBackend>());
    Event e;
    e.kind = EventKind::Signal;
    e.agent_id = "alpha";
    e.symbol = "AAPL";
    e.action = Action::Buy;
    e.confidence = 0.8f;

    Embedding out = embedder.embed(e);
    assert(out.degraded);
    assert(out.backend == "hash");
    assert(out.vector.size() == DIM);
    assert(embedder.degraded());
    assert(capture.count("degraded") == 1);

    // Same input, same fallback vector
    assert(embedder.embed(e).vector == out.vector);
    assert(embedder.status().fallbacks == 2);

    bool threw = false;
    try {
        embedder.embed_text("   ");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // No similarity source attached: nothing to find
    assert(embedder.search(out.vector, 5).empty());

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_embedder_primary_and_cache() {
    std::cout << "Testing embedder primary backend and cache..." << std::endl;

    auto backend = std::make_unique<CountingBackend>();
    CountingBackend* raw = backend.get();
    Embedder embedder(embedder_config(), std::move(backend));
    assert(!embedder.degraded());

    auto a = embedder.embed_text("Momentum buy AAPL");
    auto b = embedder.embed_text("momentum   buy aapl");
    assert(!a.degraded);
    assert(a.backend == "counting");
    assert(a.vector == b.vector);
    assert(raw->calls == 1);
    assert(embedder.status().cache_hits == 1);

    std::cout << "  PASS" << std::endl;
}

void test_embedder_search_empty_store() {
    std::cout << "Testing embedder search over an empty store..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        Embedder embedder(embedder_config());
        embedder.attach(&store);

        auto hits = embedder.search(test_vector(1.0f), 10);
        assert(hits.empty());

        store.insert(make_record(1.0f));
        hits = embedder.search(test_vector(1.0f), 10);
        assert(hits.size() == 1);
        assert(hits[0].distance < 1e-3f);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Indexes
// ═══════════════════════════════════════════════════════════════════════════

void test_hnsw_index() {
    std::cout << "Testing HNSW index..." << std::endl;

    HNSWIndex index;
    for (uint32_t i = 0; i < 200; ++i) {
        index.insert(i, test_vector(static_cast<float>(i) * 3.0f));
    }
    assert(index.size() == 200);

    auto hits = index.search(test_vector(42.0f * 3.0f), 5);
    assert(!hits.empty());
    assert(hits[0].first == 42);
    assert(hits[0].second < 1e-3f);
    for (size_t i = 1; i < hits.size(); ++i) {
        assert(hits[i - 1].second <= hits[i].second);
    }

    index.remove(42);
    assert(!index.contains(42));
    hits = index.search(test_vector(42.0f * 3.0f), 5);
    for (const auto& [slot, d] : hits) assert(slot != 42);

    std::cout << "  PASS" << std::endl;
}

void test_filter_index() {
    std::cout << "Testing filter bitmaps..." << std::endl;

    FilterIndex f;
    MemoryRecord a = make_record(1.0f, EventKind::Signal, "AAPL");
    MemoryRecord b = make_record(2.0f, EventKind::Decision, "AAPL");
    b.outcome = OutcomeLabel::Failure;
    MemoryRecord c = make_record(3.0f, EventKind::Outcome, "TSLA");
    c.outcome = OutcomeLabel::Success;

    f.add(0, facets_of(a));
    f.add(1, facets_of(b));
    f.add(2, facets_of(c));
    assert(f.live_count() == 3);
    assert(f.count(symbol_facet("AAPL")) == 2);

    RecordFilter aapl;
    aapl.symbol = "AAPL";
    assert(bitmap_to_vector(f.candidates(aapl).get()).size() == 2);

    RecordFilter no_failures;
    no_failures.exclude_outcomes = {OutcomeLabel::Failure};
    auto ok = bitmap_to_vector(f.candidates(no_failures).get());
    assert(ok.size() == 2);
    assert(std::find(ok.begin(), ok.end(), 1u) == ok.end());

    RecordFilter kinds;
    kinds.kinds = {EventKind::Signal, EventKind::Outcome};
    assert(bitmap_to_vector(f.candidates(kinds).get()).size() == 2);

    f.remove_all(0);
    assert(f.live_count() == 2);
    assert(f.count(symbol_facet("AAPL")) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_vector_log_torn_tail() {
    std::cout << "Testing vector log torn tail..." << std::endl;

    std::string dir = temp_dir();
    std::string path = dir + "/vectors.idx";
    std::string error;
    RecordId first = RecordId::generate();
    {
        VectorLog log;
        assert(log.open(path, DIM, error));
        assert(log.replay().entries.empty());
        assert(log.append(first, test_vector(1.0f)).has_value());
        assert(log.append(RecordId::generate(), test_vector(2.0f)).has_value());
    }

    // Half an entry, as a crash mid-append would leave it
    FILE* f = fopen(path.c_str(), "ab");
    assert(f);
    const char junk[] = "VECTpartial";
    fwrite(junk, 1, sizeof(junk), f);
    fclose(f);

    {
        VectorLog log;
        assert(log.open(path, DIM, error));
        ReplayResult r = log.replay();
        assert(r.entries.size() == 2);
        assert(r.entries[0].id == first);
        assert(r.entries[0].vector == test_vector(1.0f));
        assert(r.torn_bytes == sizeof(junk));
    }
    {
        VectorLog log;
        assert(!log.open(path, DIM + 1, error));
        assert(error.find("dimension") != std::string::npos);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_lru_cache() {
    std::cout << "Testing LRU cache..." << std::endl;

    LruCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    assert(cache.get("a") == 1);
    cache.put("c", 3);           // evicts b, a was used more recently
    assert(!cache.get("b").has_value());
    assert(cache.get("a") == 1);
    assert(cache.get("c") == 3);
    assert(cache.size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Memory Store
// ═══════════════════════════════════════════════════════════════════════════

void test_store_round_trip() {
    std::cout << "Testing memory store round trip..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.writable());

        for (EventKind kind : {EventKind::Signal, EventKind::Decision, EventKind::Outcome}) {
            MemoryRecord r = make_record(static_cast<int>(kind) + 1.0f, kind);
            if (kind == EventKind::Decision) r.outcome = OutcomeLabel::Pending;
            RecordId id = store.insert(r);
            auto back = store.get(id);
            assert(back.has_value());
            assert(back->id == id);
            assert(back->same_content(r));
        }
        assert(store.size() == 3);
        assert(!store.get(RecordId::generate()).has_value());
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_validation() {
    std::cout << "Testing memory store validation..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());

        auto rejects = [&](MemoryRecord r) {
            try {
                store.insert(std::move(r));
            } catch (const ValidationError&) {
                return true;
            }
            return false;
        };

        MemoryRecord wrong_dim = make_record(1.0f);
        wrong_dim.vector.resize(DIM / 2);
        assert(rejects(wrong_dim));

        MemoryRecord no_vector = make_record(1.0f);
        no_vector.vector.clear();
        assert(rejects(no_vector));

        MemoryRecord no_summary = make_record(1.0f);
        no_summary.summary.clear();
        assert(rejects(no_summary));

        MemoryRecord no_agent = make_record(1.0f);
        no_agent.agent_id.clear();
        assert(rejects(no_agent));

        MemoryRecord nan = make_record(1.0f);
        nan.vector[3] = std::nanf("");
        assert(rejects(nan));

        assert(store.size() == 0);
        assert(store.stats().inserts == 0);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_update_outcome_idempotent() {
    std::cout << "Testing update_outcome idempotence..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        MemoryRecord r = make_record(1.0f, EventKind::Decision);
        r.outcome = OutcomeLabel::Pending;
        RecordId id = store.insert(r);

        assert(store.update_outcome(id, OutcomeLabel::Success));
        auto once = store.get(id);
        assert(!store.update_outcome(id, OutcomeLabel::Success));
        auto twice = store.get(id);
        assert(once->same_content(*twice));
        assert(twice->outcome == OutcomeLabel::Success);
        assert(store.stats().outcome_updates == 1);

        bool threw = false;
        try {
            store.update_outcome(RecordId::generate(), OutcomeLabel::Failure);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        // The label survived a restart
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.size() == 1);
        assert(store.stats().outcomes == 0);
        RecordFilter successes;
        successes.exclude_outcomes = {OutcomeLabel::Failure, OutcomeLabel::Pending};
        auto hits = store.query_similar(test_vector(1.0f), 5, successes);
        assert(hits.size() == 1);
        assert(hits[0].record.outcome == OutcomeLabel::Success);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_query() {
    std::cout << "Testing memory store similarity query..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());

        assert(store.query_similar(test_vector(1.0f), 5).empty());

        bool threw = false;
        try {
            store.query_similar(std::vector<float>(DIM + 3, 0.1f), 5);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);

        std::vector<RecordId> ids;
        for (int i = 0; i < 20; ++i) {
            MemoryRecord r = make_record(static_cast<float>(i) * 5.0f,
                                         i % 2 ? EventKind::Signal : EventKind::Outcome,
                                         i < 10 ? "AAPL" : "TSLA");
            if (r.kind == EventKind::Outcome) {
                r.outcome = i % 4 == 0 ? OutcomeLabel::Failure : OutcomeLabel::Success;
            }
            ids.push_back(store.insert(r));
        }

        auto hits = store.query_similar(test_vector(15.0f), 3);
        assert(hits.size() == 3);
        assert(hits[0].record.id == ids[3]);
        assert(hits[0].similarity > 0.999f);
        for (size_t i = 1; i < hits.size(); ++i) assert(hits[i - 1].distance <= hits[i].distance);

        RecordFilter filter;
        filter.symbol = "TSLA";
        filter.kinds = {EventKind::Outcome};
        filter.exclude_outcomes = {OutcomeLabel::Failure};
        for (const auto& h : store.query_similar(test_vector(15.0f), 20, filter)) {
            assert(h.record.symbol == "TSLA");
            assert(h.record.kind == EventKind::Outcome);
            assert(h.record.outcome == OutcomeLabel::Success);
        }

        StoreStats s = store.stats();
        assert(s.records == 20);
        assert(s.signals == 10);
        assert(s.outcomes == 10);
        assert(s.failures == 5);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_fault_injection() {
    std::cout << "Testing memory store insert faults..." << std::endl;

    std::string dir = temp_dir();
    LogCapture capture;
    set_log_sink(capture.sink());
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        RecordId keep = store.insert(make_record(100.0f));

        for (WriteStage stage : {WriteStage::Metadata, WriteStage::Vector, WriteStage::Commit}) {
            capture.clear();
            store.set_write_probe([stage](WriteStage s) { return s != stage; });
            bool threw = false;
            try {
                store.insert(make_record(1.0f));
            } catch (const DegradedDependencyError&) {
                threw = true;
            }
            assert(threw);
            assert(store.size() == 1);

            // The id handed out for the failed write resolves to nothing
            auto failed = capture.events();
            auto it = std::find_if(failed.begin(), failed.end(),
                                   [](const LogEvent& e) { return e.event == "insert_failed"; });
            assert(it != failed.end());
            auto id = RecordId::parse(it->field("record"));
            assert(id.has_value());
            assert(!store.get(*id).has_value());

            auto hits = store.query_similar(test_vector(1.0f), 5);
            assert(hits.size() == 1);
            assert(hits[0].record.id == keep);
        }

        store.set_write_probe(nullptr);
        store.insert(make_record(2.0f));
        assert(store.size() == 2);
        assert(store.stats().failed_inserts == 3);
    }
    {
        // No orphan on either side after a restart
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.size() == 2);
        assert(store.stats().orphans_dropped == 0);
    }
    set_log_sink(nullptr);
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_persistence_and_orphans() {
    std::cout << "Testing memory store persistence and reconciliation..." << std::endl;

    std::string dir = temp_dir();
    RecordId a, b;
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        a = store.insert(make_record(1.0f));
        b = store.insert(make_record(2.0f));
    }
    {
        // A vector whose row never committed
        VectorLog log;
        std::string error;
        assert(log.open(dir + "/vectors.idx", DIM, error));
        log.replay();
        assert(log.append(RecordId::generate(), test_vector(9.0f)).has_value());
    }
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.size() == 2);
        assert(store.get(a).has_value());
        assert(store.get(b).has_value());
        assert(store.stats().orphans_dropped == 1);
        assert(store.query_similar(test_vector(9.0f), 5).size() == 2);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_read_only() {
    std::cout << "Testing memory store read-only mode..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore owner(store_config(dir));
        assert(owner.open());
        owner.insert(make_record(1.0f));

        // Second writer finds the vector log locked
        MemoryStore second(store_config(dir));
        assert(!second.open());
        assert(!second.writable());
        assert(second.mode() == StoreMode::ReadOnly);
        assert(second.degraded_reason().find("locked") != std::string::npos);

        bool threw = false;
        try {
            second.insert(make_record(2.0f));
        } catch (const DegradedDependencyError&) {
            threw = true;
        }
        assert(threw);
        assert(second.query_similar(test_vector(1.0f), 3).empty());
    }
    {
        // A data directory that cannot exist
        std::string file = dir + "/plain_file";
        FILE* f = fopen(file.c_str(), "w");
        assert(f);
        fclose(f);
        MemoryStore store(store_config(file + "/memory"));
        assert(!store.open());
        assert(!store.degraded_reason().empty());
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_sweep() {
    std::cout << "Testing retention sweep..." << std::endl;

    std::string dir = temp_dir();
    Timestamp current = now();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        for (int i = 0; i < 6; ++i) {
            MemoryRecord r = make_record(static_cast<float>(i));
            r.created = current - (i < 4 ? 100 : 1) * MILLIS_PER_DAY;
            store.insert(r);
        }
        assert(store.sweep_retention(current) == 4);
        assert(store.size() == 2);
        assert(store.sweep_retention(current) == 0);
        assert(store.query_similar(test_vector(0.0f), 10).size() == 2);

        // Survivors were renumbered; new records land beside them
        RecordId fresh = store.insert(make_record(9.0f));
        assert(store.size() == 3);
        assert(store.get(fresh).has_value());
        assert(store.query_similar(test_vector(9.0f), 1).front().record.id == fresh);
        assert(store.writable());

        // Compaction replaced the log file without letting a second writer in
        MemoryStore second(store_config(dir));
        assert(!second.open());
        assert(second.degraded_reason().find("locked") != std::string::npos);
    }
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.size() == 3);
        assert(store.stats().orphans_dropped == 0);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_payload_durability() {
    std::cout << "Testing payload numbers survive a restart..." << std::endl;

    std::string dir = temp_dir();
    set_log_sink(nullptr);
    RecordId direct, routed;
    {
        MemoryStore store(store_config(dir));
        assert(store.open());

        MemoryRecord bad = make_record(1.0f);
        bad.payload.numbers["zscore"] = std::nan("");
        bool rejected = false;
        try {
            store.insert(bad);
        } catch (const ValidationError&) {
            rejected = true;
        }
        assert(rejected);
        assert(store.size() == 0);

        MemoryRecord good = make_record(2.0f);
        good.payload.numbers["spread"] = -0.25;
        direct = store.insert(good);

        // The router keeps the event and drops only the unusable numbers
        Embedder embedder(embedder_config());
        embedder.attach(&store);
        OutputRouter output(OutputRouterConfig{}, embedder, store);
        Event e = signal_event("alpha", "NVDA", 0.8f);
        e.payload.numbers["rsi"] = 48.0;
        e.payload.numbers["zscore"] = std::nan("");
        e.payload.numbers["ratio"] = std::numeric_limits<double>::infinity();
        IngestReport r = output.ingest("alpha", e);
        assert(r.persisted);
        routed = *r.record_id;
    }
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        assert(store.size() == 2);
        assert(store.stats().orphans_dropped == 0);

        auto a = store.get(direct);
        assert(a.has_value());
        assert(a->payload.number("spread") == -0.25);
        assert(a->payload.number("rsi") == 61.5);

        auto b = store.get(routed);
        assert(b.has_value());
        assert(b->symbol == "NVDA");
        assert(b->payload.number("rsi") == 48.0);
        assert(!b->payload.number("zscore").has_value());
        assert(!b->payload.number("ratio").has_value());
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_store_concurrent_reads() {
    std::cout << "Testing concurrent reads during inserts..." << std::endl;

    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        std::atomic<bool> done{false};
        std::atomic<int> incomplete{0};

        std::vector<std::thread> readers;
        for (int t = 0; t < 3; ++t) {
            readers.emplace_back([&, t] {
                while (!done) {
                    for (const auto& h : store.query_similar(test_vector(static_cast<float>(t)), 5)) {
                        if (!store.get(h.record.id) || h.record.summary.empty()) ++incomplete;
                    }
                }
            });
        }
        for (int i = 0; i < 60; ++i) store.insert(make_record(static_cast<float>(i)));
        done = true;
        for (auto& r : readers) r.join();

        assert(incomplete == 0);
        assert(store.size() == 60);
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scoring
// ═══════════════════════════════════════════════════════════════════════════

void test_importance() {
    std::cout << "Testing importance scoring..." << std::endl;

    ImportanceConfig cfg;
    float signal = importance(EventKind::Signal, 0.5f, 0.5f, cfg);
    float decision = importance(EventKind::Decision, 0.5f, 0.5f, cfg);
    float outcome = importance(EventKind::Outcome, 0.5f, 0.5f, cfg);
    assert(signal < decision && decision < outcome);

    assert(importance(EventKind::Signal, 0.9f, 0.5f, cfg) > signal);
    assert(importance(EventKind::Signal, 0.5f, 0.9f, cfg) > signal);
    for (float s : {0.0f, 0.5f, 1.0f, 7.0f}) {
        float v = importance(EventKind::Outcome, s, s, cfg);
        assert(v >= 0.0f && v <= 1.0f);
    }

    assert(novelty_from_distance(std::nullopt) == 1.0f);
    assert(near(novelty_from_distance(0.0f), 0.0f));
    assert(novelty_from_distance(0.2f) < novelty_from_distance(0.6f));

    std::cout << "  PASS" << std::endl;
}

void test_relevance() {
    std::cout << "Testing recall ranking..." << std::endl;

    RankingConfig cfg;
    Timestamp current = now();
    MemoryRecord fresh = make_record(1.0f);
    fresh.created = current;
    MemoryRecord stale = fresh;
    stale.created = current - 200 * MILLIS_PER_DAY;

    assert(relevance(0.8f, fresh, current, 0.5f, cfg) > relevance(0.8f, stale, current, 0.5f, cfg));
    assert(near(relevance(0.8f, fresh, current, 0.0f, cfg), relevance(0.8f, stale, current, 0.0f, cfg)));

    MemoryRecord won = fresh;
    won.outcome = OutcomeLabel::Success;
    assert(relevance(0.8f, won, current, 0.3f, cfg) > relevance(0.8f, fresh, current, 0.3f, cfg));

    MemoryRecord important = fresh;
    important.importance = 0.95f;
    assert(relevance(0.8f, important, current, 0.3f, cfg) > relevance(0.8f, fresh, current, 0.3f, cfg));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Consensus
// ═══════════════════════════════════════════════════════════════════════════

WeightedSignal vote(const std::string& agent, const std::string& symbol, Action action,
                    float confidence, float weight, float risk = 0.2f) {
    WeightedSignal ws;
    ws.signal.id = "sig-1-" + agent;
    ws.signal.agent_id = agent;
    ws.signal.timestamp = 1000;
    ws.signal.symbol = symbol;
    ws.signal.action = action;
    ws.signal.confidence = confidence;
    ws.signal.risk = risk;
    ws.weight = weight;
    return ws;
}

void test_consensus_weighted_average() {
    std::cout << "Testing consensus weighted average..." << std::endl;

    auto r = compute_consensus({
        vote("a", "AAPL", Action::Buy, 0.9f, 1.0f),
        vote("b", "AAPL", Action::Buy, 0.6f, 1.0f),
        vote("c", "AAPL", Action::Buy, 0.3f, 0.5f),
    });
    assert(r.chosen.has_value());
    assert(!r.tie);
    assert(near(r.chosen->consensus, (0.9 + 0.6 + 0.15) / 2.5, 1e-5));
    assert(r.chosen->agent_ids == std::vector<std::string>({"a", "b", "c"}));

    // Dissent dilutes
    auto split = compute_consensus({
        vote("a", "AAPL", Action::Buy, 0.9f, 1.0f),
        vote("b", "AAPL", Action::Sell, 0.9f, 1.0f, 0.5f),
    });
    assert(split.chosen->action == Action::Buy);
    assert(near(split.chosen->consensus, 0.45, 1e-5));

    assert(compute_consensus({}).candidates.empty());

    std::cout << "  PASS" << std::endl;
}

void test_consensus_order_independence() {
    std::cout << "Testing consensus order independence..." << std::endl;

    std::vector<WeightedSignal> signals = {
        vote("a", "AAPL", Action::Buy, 0.9f, 1.2f, 0.3f),
        vote("b", "AAPL", Action::Sell, 0.7f, 0.8f, 0.4f),
        vote("c", "AAPL", Action::Buy, 0.4f, 1.0f, 0.1f),
        vote("d", "TSLA", Action::Buy, 0.95f, 0.6f, 0.6f),
        vote("e", "TSLA", Action::Hold, 0.5f, 1.9f, 0.2f),
        vote("f", "MSFT", Action::Sell, 0.33f, 1.7f, 0.5f),
    };
    ConsensusResult base = compute_consensus(signals);

    std::vector<size_t> order(signals.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    size_t permutations = 0;
    do {
        std::vector<WeightedSignal> shuffled;
        for (size_t i : order) shuffled.push_back(signals[i]);
        ConsensusResult r = compute_consensus(shuffled);
        assert(r.candidates.size() == base.candidates.size());
        for (size_t i = 0; i < r.candidates.size(); ++i) {
            assert(r.candidates[i].symbol == base.candidates[i].symbol);
            assert(r.candidates[i].action == base.candidates[i].action);
            assert(r.candidates[i].consensus == base.candidates[i].consensus);
            assert(r.candidates[i].risk == base.candidates[i].risk);
        }
        assert(r.chosen.has_value() == base.chosen.has_value());
        ++permutations;
    } while (std::next_permutation(order.begin(), order.end()));
    assert(permutations == 720);

    std::cout << "  PASS" << std::endl;
}

void test_consensus_no_double_count() {
    std::cout << "Testing consensus deduplication..." << std::endl;

    auto single = compute_consensus({vote("a", "AAPL", Action::Buy, 0.8f, 1.0f),
                                     vote("b", "AAPL", Action::Buy, 0.4f, 1.0f)});

    // Same signal delivered twice
    auto doubled = compute_consensus({vote("a", "AAPL", Action::Buy, 0.8f, 1.0f),
                                      vote("a", "AAPL", Action::Buy, 0.8f, 1.0f),
                                      vote("b", "AAPL", Action::Buy, 0.4f, 1.0f)});
    assert(doubled.duplicates == 1);
    assert(doubled.chosen->consensus == single.chosen->consensus);

    // One agent, two opinions on one symbol: only the latest counts
    WeightedSignal older = vote("a", "AAPL", Action::Sell, 0.9f, 1.0f);
    older.signal.id = "sig-0-a";
    older.signal.timestamp = 500;
    auto revised = compute_consensus({older, vote("a", "AAPL", Action::Buy, 0.8f, 1.0f),
                                      vote("b", "AAPL", Action::Buy, 0.4f, 1.0f)});
    assert(revised.duplicates == 1);
    assert(revised.chosen->action == Action::Buy);
    assert(revised.chosen->consensus == single.chosen->consensus);

    std::cout << "  PASS" << std::endl;
}

void test_consensus_tie_break() {
    std::cout << "Testing consensus tie-break..." << std::endl;

    // Equal consensus, lower risk wins
    auto r = compute_consensus({vote("a", "AAPL", Action::Buy, 0.8f, 1.0f, 0.2f),
                                vote("b", "TSLA", Action::Sell, 0.8f, 1.0f, 0.6f)});
    assert(!r.tie);
    assert(r.chosen->symbol == "AAPL");

    // Equal consensus, equal risk: no action
    auto t = compute_consensus({vote("a", "AAPL", Action::Buy, 0.8f, 1.0f, 0.3f),
                                vote("b", "TSLA", Action::Sell, 0.8f, 1.0f, 0.3f)});
    assert(t.tie);
    assert(!t.chosen.has_value());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Risk gates and weights
// ═══════════════════════════════════════════════════════════════════════════

void test_risk_gates() {
    std::cout << "Testing risk gates..." << std::endl;

    RiskLimits limits;
    limits.max_open_positions = 2;
    limits.max_daily_loss = 500.0;
    limits.symbol_exposure_cap = 0.08;

    PortfolioState p;
    assert(evaluate_gates(limits, p, "AAPL", Action::Buy, 0.05).passed());

    p.open_positions = 2;
    assert(!evaluate_gates(limits, p, "AAPL", Action::Buy, 0.05).passed());
    p.open_positions = 0;

    p.daily_pnl = -600.0;
    auto loss = evaluate_gates(limits, p, "AAPL", Action::Buy, 0.05);
    assert(loss.violations.size() == 1);
    assert(loss.violations[0].find("max_daily_loss") == 0);
    p.daily_pnl = 0.0;

    p.exposure["AAPL"] = 0.05;
    assert(!evaluate_gates(limits, p, "AAPL", Action::Buy, 0.05).passed());
    assert(evaluate_gates(limits, p, "TSLA", Action::Buy, 0.05).passed());

    // Risk agents may only tighten
    Signal tighter;
    tighter.payload.numbers["max_open_positions"] = 1;
    Signal looser;
    looser.payload.numbers["max_daily_loss"] = 10000.0;
    RiskLimits t = tighten(limits, {tighter, looser});
    assert(t.max_open_positions == 1);
    assert(t.max_daily_loss == 500.0);

    // A huge, infinite or NaN "no limit" value keeps the configured limit
    Signal huge;
    huge.payload.numbers["max_open_positions"] = 1e30;
    Signal infinite;
    infinite.payload.numbers["max_open_positions"] = std::numeric_limits<double>::infinity();
    Signal nan;
    nan.payload.numbers["max_open_positions"] = std::nan("");
    assert(tighten(limits, {huge, infinite, nan}).max_open_positions == 2);
    Signal zero;
    zero.payload.numbers["max_open_positions"] = 0.0;
    assert(tighten(limits, {huge, zero}).max_open_positions == 0);

    // A zero loss limit halts on the first loss, not on a flat day
    RiskLimits strict = limits;
    strict.max_daily_loss = 0.0;
    PortfolioState flat;
    assert(evaluate_gates(strict, flat, "AAPL", Action::Buy, 0.05).passed());
    flat.daily_pnl = 25.0;
    assert(evaluate_gates(strict, flat, "AAPL", Action::Buy, 0.05).passed());
    flat.daily_pnl = -0.01;
    assert(!evaluate_gates(strict, flat, "AAPL", Action::Buy, 0.05).passed());

    // Daily loss resets at the UTC day boundary
    PortfolioState day;
    day.roll_day(10 * MILLIS_PER_DAY + 5);
    day.daily_pnl = -800.0;
    day.roll_day(10 * MILLIS_PER_DAY + 999);
    assert(day.daily_pnl == -800.0);
    day.roll_day(11 * MILLIS_PER_DAY);
    assert(day.daily_pnl == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_weight_bounds() {
    std::cout << "Testing bounded weight updates..." << std::endl;

    const float step = 0.1f;
    const float decay = 0.5f;
    for (float w : {0.001f, 0.05f, 0.1f, 0.19f, 0.5f, 1.0f, 1.95f, 2.0f}) {
        float after = adjust_weight(w, OutcomeLabel::Failure, step, decay);
        assert(after > 0.0f);
        assert(after < w);
        assert(w - after <= step + 1e-6f);

        float up = adjust_weight(w, OutcomeLabel::Success, step, decay);
        assert(up <= MAX_AGENT_WEIGHT);
        assert(up - w <= step + 1e-6f);

        assert(adjust_weight(w, OutcomeLabel::Neutral, step, decay) == w);
    }

    // Repeated failures never reach zero
    float w = 1.0f;
    for (int i = 0; i < 60; ++i) w = adjust_weight(w, OutcomeLabel::Failure, step, decay);
    assert(w > 0.0f);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Router
// ═══════════════════════════════════════════════════════════════════════════

std::vector<AgentSpec> router_agents() {
    AgentSpec src = scripted("src", AgentRole::Strategy, 1.0f);
    src.interests = {AgentCategory::SignalGeneration};
    src.significance = 1.0f;
    AgentSpec w1 = scripted("watch1", AgentRole::RuleSet, 1.0f);
    w1.interests = {AgentCategory::SignalGeneration};
    AgentSpec w2 = scripted("watch2", AgentRole::RiskManager, 1.0f);
    w2.interests = {AgentCategory::SignalGeneration, AgentCategory::Coordination};
    AgentSpec deaf = scripted("deaf", AgentRole::MarketData, 1.0f);
    deaf.interests = {AgentCategory::Execution};
    return {src, w1, w2, deaf};
}

void test_output_router_fanout_and_admission() {
    std::cout << "Testing output router fan-out and admission..." << std::endl;

    Rig rig(router_agents(), fast_config());

    auto subs = rig.output.subscribers_for(AgentCategory::SignalGeneration, "src");
    assert(subs == std::vector<std::string>({"watch1", "watch2"}));

    IngestReport r = rig.output.ingest("src", signal_event("src", "AAPL", 0.8f));
    assert(r.subscribers == 2);
    assert(r.delivered == 2);
    assert(r.failed == 0);
    assert(r.admitted);
    assert(r.persisted);
    assert(r.record_id.has_value());

    auto stored = rig.store.get(*r.record_id);
    assert(stored.has_value());
    assert(stored->kind == EventKind::Signal);
    assert(stored->agent_id == "src");
    assert(stored->vector.size() == DIM);
    assert(near(stored->importance, r.importance, 1e-6));
    assert(rig.traces["watch1"]->consumed().size() == 1);
    assert(rig.traces["deaf"]->consumed().empty());
    assert(rig.traces["src"]->consumed().empty());

    // The same event again is nothing new: novelty drops, and with a low
    // significance the repeat falls under the threshold
    rig.output.set_significance("src", 0.0f);
    IngestReport again = rig.output.ingest("src", signal_event("src", "AAPL", 0.8f));
    assert(again.novelty < 0.05f);
    assert(!again.admitted);
    assert(!again.persisted);
    assert(again.delivered == 2);
    assert(rig.store.size() == 1);

    OutputRouterStats s = rig.output.stats();
    assert(s.events == 2);
    assert(s.persisted == 1);
    assert(s.deliveries == 4);

    std::cout << "  PASS" << std::endl;
}

void test_output_router_persist_failure() {
    std::cout << "Testing fan-out survives a failed memory write..." << std::endl;

    Rig rig(router_agents(), fast_config());
    LogCapture capture;
    set_log_sink(capture.sink());

    rig.store.set_write_probe([](WriteStage s) { return s != WriteStage::Vector; });
    IngestReport r = rig.output.ingest("src", signal_event("src", "TSLA", 0.9f));

    assert(r.admitted);
    assert(!r.persisted);
    assert(r.persist_pending());
    assert(!r.record_id.has_value());
    assert(!r.persist_error.empty());
    assert(r.delivered == 2);
    assert(rig.store.size() == 0);

    auto events = capture.events();
    auto it = std::find_if(events.begin(), events.end(),
                           [](const LogEvent& e) { return e.event == "insert_failed"; });
    assert(it != events.end());
    auto id = RecordId::parse(it->field("record"));
    assert(id && !rig.store.get(*id).has_value());
    assert(capture.count("persist_failed") == 1);

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_output_router_subscriber_failure() {
    std::cout << "Testing independent subscriber delivery..." << std::endl;

    Rig rig(router_agents(), fast_config());
    set_log_sink(nullptr);

    // watch1 fails every attempt; watch2 still gets the event
    rig.traces["watch1"]->fail_deliveries(10);
    IngestReport r = rig.output.ingest("src", signal_event("src", "AAPL", 0.7f));
    assert(r.subscribers == 2);
    assert(r.delivered == 1);
    assert(r.failed == 1);
    assert(rig.traces["watch2"]->consumed().size() == 1);

    // One failure is absorbed by the immediate retry
    rig.traces["watch1"]->fail_deliveries(1);
    IngestReport retried = rig.output.ingest("src", signal_event("src", "MSFT", 0.7f));
    assert(retried.delivered == 2);
    assert(rig.traces["watch1"]->consumed().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_delivery_backlog_bound() {
    std::cout << "Testing bounded delivery backlog..." << std::endl;

    set_log_sink(nullptr);
    std::string dir = temp_dir();
    {
        MemoryStore store(store_config(dir));
        assert(store.open());
        Embedder embedder(embedder_config());
        embedder.attach(&store);
        AgentSupervisor supervisor(1, 3);
        OutputRouter output(OutputRouterConfig{}, embedder, store, &supervisor);

        AgentSpec spec = scripted("slow", AgentRole::RuleSet, 1.0f);
        spec.interests = {AgentCategory::SignalGeneration};
        output.subscribe({spec.id, spec.interests});
        auto agent = make_agent(spec);
        auto trace = agent->trace();
        trace->delay_deliveries(500);
        supervisor.add(std::move(agent));
        supervisor.start();

        Event e = signal_event("src", "AAPL", 0.7f);
        auto first = supervisor.deliver("slow", e);
        assert(eventually([&] { return supervisor.backlog("slow") == 1 && supervisor.queued("slow") == 0; }));
        auto second = supervisor.deliver("slow", e);
        auto third = supervisor.deliver("slow", e);
        assert(supervisor.queued("slow") == 2);

        // A subscriber with work already queued is not waited on
        auto started = Clock::now();
        IngestReport r = output.ingest("src", e);
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        assert(r.subscribers == 1);
        assert(r.skipped == 1);
        assert(r.delivered == 0);
        assert(r.timed_out == 0);
        assert(waited.count() < 200);
        assert(output.stats().deliveries_behind == 1);

        // The queue is full: new work is refused instead of piling up
        bool refused = false;
        try {
            supervisor.deliver("slow", e);
        } catch (const DegradedDependencyError&) {
            refused = true;
        }
        assert(refused);
        IngestReport full = output.ingest("src", e);
        assert(full.failed == 1);

        assert(first.get());
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

void test_output_router_annotate() {
    std::cout << "Testing outcome annotation..." << std::endl;

    Rig rig(router_agents(), fast_config());
    Event d;
    d.kind = EventKind::Decision;
    d.agent_id = COORDINATOR_ID;
    d.category = AgentCategory::Coordination;
    d.ref_id = "dec-1";
    d.symbol = "AAPL";
    d.action = Action::Buy;
    d.confidence = 0.7f;
    d.verdict = Verdict::Approved;
    IngestReport r = rig.output.ingest(COORDINATOR_ID, d);
    assert(r.persisted);
    assert(rig.store.get(*r.record_id)->outcome == OutcomeLabel::Pending);
    assert(rig.traces["watch2"]->consumed().size() == 1);

    assert(rig.output.annotate_outcome(*r.record_id, OutcomeLabel::Success));
    assert(rig.output.annotate_outcome(*r.record_id, OutcomeLabel::Success));
    assert(rig.store.get(*r.record_id)->outcome == OutcomeLabel::Success);
    assert(rig.output.stats().outcome_annotations == 1);

    set_log_sink(nullptr);
    assert(!rig.output.annotate_outcome(RecordId::generate(), OutcomeLabel::Failure));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Input Router
// ═══════════════════════════════════════════════════════════════════════════

RecordId remember(Rig& rig, const std::string& text, EventKind kind,
                  std::optional<OutcomeLabel> outcome, float importance = 0.6f,
                  const std::string& symbol = "AAPL") {
    MemoryRecord r;
    Embedding e = rig.embedder.embed_text(text);
    r.vector = e.vector;
    r.summary = e.summary;
    r.agent_id = "alpha";
    r.kind = kind;
    r.importance = importance;
    r.created = now();
    r.outcome = outcome;
    r.symbol = symbol;
    return rig.store.insert(r);
}

void test_input_router_empty() {
    std::cout << "Testing recall over empty memory..." << std::endl;

    Rig rig(router_agents(), fast_config());
    RetrievalQuery q;
    q.text = "aapl breakout";
    auto results = rig.input.retrieve("src", q, 5);
    assert(results.empty());
    assert(rig.input.stats().failures == 0);

    std::cout << "  PASS" << std::endl;
}

void test_input_router_failure_bias() {
    std::cout << "Testing recall excludes failed precedent..." << std::endl;

    Rig rig(router_agents(), fast_config());
    RecordId good = remember(rig, "aapl breakout buy worked", EventKind::Outcome, OutcomeLabel::Success);
    RecordId bad = remember(rig, "aapl breakout buy lost", EventKind::Outcome, OutcomeLabel::Failure);

    RetrievalQuery q;
    q.text = "aapl breakout buy";
    auto results = rig.input.retrieve("src", q, 10);
    assert(results.size() == 1);
    assert(results[0].record.id == good);

    q.include_failures = true;
    results = rig.input.retrieve("src", q, 10);
    assert(results.size() == 2);
    bool saw_bad = false;
    for (const auto& r : results) saw_bad |= r.record.id == bad;
    assert(saw_bad);
    assert(results[0].score >= results[1].score);

    std::cout << "  PASS" << std::endl;
}

void test_input_router_kinds_and_cache() {
    std::cout << "Testing recall kind filter and cache..." << std::endl;

    Rig rig(router_agents(), fast_config());
    remember(rig, "tsla gap down sell", EventKind::Signal, std::nullopt, 0.5f, "TSLA");
    RecordId key_decision = remember(rig, "tsla gap down decision", EventKind::Decision,
                                     OutcomeLabel::Pending, 0.9f, "TSLA");
    RecordId outcome = remember(rig, "tsla gap down outcome", EventKind::Outcome,
                                OutcomeLabel::Neutral, 0.75f, "TSLA");

    RetrievalQuery q;
    q.text = "tsla gap down";
    q.kinds = {EventKind::Outcome};
    q.symbol = "TSLA";
    auto results = rig.input.retrieve("watch1", q, 10);

    // The signal is filtered out; the important decision is kept anyway
    assert(results.size() == 2);
    std::set<RecordId> ids;
    for (const auto& r : results) ids.insert(r.record.id);
    assert(ids.count(outcome) && ids.count(key_decision));

    rig.input.begin_tick(1);
    rig.input.retrieve("watch1", q, 10);
    rig.input.retrieve("watch1", q, 10);
    rig.input.retrieve("watch2", q, 10);
    InputRouterStats s = rig.input.stats();
    assert(s.queries == 4);
    assert(s.cache_hits == 1);

    // Memory written after the cached answer shows up on the next tick
    remember(rig, "tsla gap down outcome again", EventKind::Outcome, OutcomeLabel::Success, 0.8f, "TSLA");
    assert(rig.input.retrieve("watch1", q, 10).size() == 2);
    rig.input.begin_tick(2);
    assert(rig.input.retrieve("watch1", q, 10).size() == 3);
    assert(rig.input.stats().cache_hits == 2);

    auto precedent = RetrievalQuery::from_context("strat", QueryType::Precedent, {{"symbol", "TSLA"}});
    assert(precedent.symbol == "TSLA");
    assert(precedent.text.find("precedent") != std::string::npos);
    assert(RetrievalQuery::from_context("strat", QueryType::Risk, {}).include_failures);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Coordinator
// ═══════════════════════════════════════════════════════════════════════════

std::vector<AgentSpec> scenario_agents() {
    AgentSpec exec = scripted("exec", AgentRole::IbkrTrader, 1.0f);
    exec.interests = {AgentCategory::Coordination};
    return {
        scripted("a", AgentRole::Strategy, 1.0f, {step("AAPL", "buy", 0.9)}),
        scripted("b", AgentRole::SignalGenerator, 1.0f, {step("AAPL", "buy", 0.6)}),
        scripted("c", AgentRole::PennyScanner, 0.5f, {step("AAPL", "buy", 0.3)}),
        exec,
    };
}

void test_coordinator_scenario_approved() {
    std::cout << "Testing weighted consensus scenario..." << std::endl;

    LogCapture capture;
    set_log_sink(capture.sink());
    {
        Rig rig(scenario_agents(), fast_config());
        TickResult r = rig.coordinator.tick(rig.state);

        assert(!r.abandoned);
        assert(r.polled == 3);
        assert(r.responded == 3);
        assert(r.decision.has_value());
        const auto& d = *r.decision;
        assert(near(d.consensus, (0.9 * 1 + 0.6 * 1 + 0.3 * 0.5) / 2.5, 1e-3));
        assert(near(d.consensus, 0.66, 1e-3));
        assert(d.verdict == Verdict::Approved);
        assert(d.action == Action::Buy);
        assert(d.symbol == "AAPL");
        assert(d.signal_ids.size() == 3);
        assert(d.contributors == std::vector<std::string>({"a", "b", "c"}));
        assert(d.position_size > 0.0 && d.position_size <= 0.05);
        assert(d.risk_score >= 0.0f && d.risk_score <= 1.0f);
        assert(d.memory_ref.has_value());
        assert(!d.degraded);

        assert(rig.state.phase == Phase::AwaitingOutcome);
        assert(rig.state.pending.count(d.id) == 1);
        assert(rig.state.portfolio.open_positions == 1);
        assert(rig.state.recent.size() == 1);
        assert(rig.state.stats.approved == 1);

        auto handed = rig.traces["exec"];
        assert(eventually([&] { return handed->handoffs().size() == 1; }));
        assert(handed->handoffs()[0].ref_id == d.id);

        // Signals were archived beside the decision
        RecordFilter signals;
        signals.kinds = {EventKind::Signal};
        assert(!rig.store.query_similar(test_vector(1.0f), 10, signals).empty());
    }
    assert(capture.count("tick_start") == 1);
    assert(capture.count("tick_end") == 1);
    assert(capture.count("decision") == 1);
    for (const auto& e : capture.events()) {
        if (e.event == "decision") {
            assert(e.field("tick") == "1");
            assert(e.field("verdict") == "approved");
        }
    }
    set_log_sink(nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_outcome_learning() {
    std::cout << "Testing outcome learning..." << std::endl;

    auto specs = scenario_agents();
    specs.push_back(scripted("quiet", AgentRole::MarketTiming, 1.0f));
    Rig rig(specs, fast_config());
    set_log_sink(nullptr);

    auto d = rig.coordinator.tick(rig.state).decision;
    assert(d && d->verdict == Verdict::Approved);

    auto resolved = rig.coordinator.report_outcome(rig.state, d->id, OutcomeLabel::Success, 120.0);
    assert(resolved.has_value());
    assert(resolved->outcome == OutcomeLabel::Success);
    assert(near(rig.agent("a").weight, 1.1));
    assert(near(rig.agent("b").weight, 1.1));
    assert(near(rig.agent("c").weight, 0.6));
    assert(rig.agent("quiet").weight == 1.0f);
    assert(rig.agent("exec").weight == 1.0f);

    // Decision record annotated, outcome record stored
    assert(rig.store.get(*d->memory_ref)->outcome == OutcomeLabel::Success);
    RecordFilter outcomes;
    outcomes.kinds = {EventKind::Outcome};
    auto hits = rig.store.query_similar(test_vector(2.0f), 5, outcomes);
    assert(hits.size() == 1);
    assert(hits[0].record.outcome == OutcomeLabel::Success);

    assert(rig.state.pending.empty());
    assert(rig.state.phase == Phase::Idle);
    assert(rig.state.portfolio.open_positions == 0);
    assert(rig.state.portfolio.daily_pnl == 120.0);
    assert(rig.state.stats.successes == 1);
    assert(rig.state.recent.back().outcome == OutcomeLabel::Success);

    // Resolving twice is a no-op
    assert(!rig.coordinator.report_outcome(rig.state, d->id, OutcomeLabel::Failure).has_value());
    assert(!rig.coordinator.report_outcome(rig.state, "dec-unknown", OutcomeLabel::Failure).has_value());

    // A failure takes away at most one step
    auto d2 = rig.coordinator.tick(rig.state).decision;
    assert(d2 && d2->verdict == Verdict::Approved);
    rig.coordinator.report_outcome(rig.state, d2->id, OutcomeLabel::Failure, -50.0);
    assert(near(rig.agent("a").weight, 1.0));
    assert(near(rig.agent("c").weight, 0.5));
    assert(rig.state.stats.failures == 1);
    assert(near(rig.state.stats.accuracy(), 0.5));
    assert(near(rig.state.stats.total_pnl, 70.0));

    bool threw = false;
    try {
        rig.coordinator.report_outcome(rig.state, d2->id, OutcomeLabel::Pending);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_outcome_timeout() {
    std::cout << "Testing pending decision timeout..." << std::endl;

    CoordinatorConfig cc = fast_config();
    cc.outcome_timeout_ms = 60 * 1000;
    Rig rig(scenario_agents(), cc);
    set_log_sink(nullptr);

    auto d = rig.coordinator.tick(rig.state).decision;
    assert(d && d->verdict == Verdict::Approved);
    assert(rig.coordinator.expire_pending(rig.state, now()) == 0);
    assert(rig.coordinator.expire_pending(rig.state, now() + 61 * 1000) == 1);

    assert(rig.state.pending.empty());
    assert(rig.state.stats.neutrals == 1);
    assert(rig.agent("a").weight == 1.0f);
    assert(rig.store.get(*d->memory_ref)->outcome == OutcomeLabel::Neutral);

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_agent_timeout() {
    std::cout << "Testing agent timeout during collecting..." << std::endl;

    auto specs = scenario_agents();
    specs.push_back(scripted("slow", AgentRole::MarketTiming, 1.0f,
                             {step("AAPL", "sell", 0.99, 0.2, 400), step("AAPL", "buy", 0.5)}));
    Rig rig(specs, fast_config());
    LogCapture capture;
    set_log_sink(capture.sink());

    TickResult r{};
    bool escaped = false;
    try {
        r = rig.coordinator.tick(rig.state);
    } catch (const std::exception&) {
        escaped = true;
    }
    assert(!escaped);
    assert(!r.abandoned);
    assert(r.timed_out == 1);
    assert(r.responded == 3);
    assert(rig.agent("slow").liveness == Liveness::Degraded);
    assert(rig.agent("slow").timeouts == 1);

    // Only the responders counted
    assert(r.decision.has_value());
    assert(r.decision->action == Action::Buy);
    assert(near(r.decision->consensus, 0.66, 1e-3));
    assert(std::find(r.decision->contributors.begin(), r.decision->contributors.end(), "slow") ==
           r.decision->contributors.end());

    bool logged = false;
    for (const auto& e : capture.events()) {
        if (e.event == "liveness" && e.field("agent") == "slow" && e.field("to") == "degraded") {
            logged = e.field("tick") == "1";
        }
    }
    assert(logged);

    // Once its worker is idle again it is probed and re-admitted
    assert(eventually([&] { return rig.supervisor.idle("slow"); }, 2000));
    TickResult next = rig.coordinator.tick(rig.state);
    assert(rig.agent("slow").liveness == Liveness::Active);
    assert(rig.agent("slow").restarts == 1);
    assert(next.polled == 4);
    assert(next.timed_out == 0);

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_agent_crash() {
    std::cout << "Testing agent crash containment..." << std::endl;

    auto specs = scenario_agents();
    specs.push_back(scripted("flaky", AgentRole::RuleSet, 1.0f,
                             {fail_step(), step("AAPL", "buy", 0.8), step("AAPL", "buy", 0.8)}));
    Rig rig(specs, fast_config());
    set_log_sink(nullptr);

    TickResult r = rig.coordinator.tick(rig.state);
    assert(r.errored == 1);
    assert(r.decision.has_value());
    assert(rig.agent("flaky").liveness == Liveness::Errored);
    assert(rig.agent("flaky").last_error.find("failed on tick 1") != std::string::npos);

    // Unhealthy: stays out
    rig.traces["flaky"]->set_healthy(false);
    TickResult r2 = rig.coordinator.tick(rig.state);
    assert(r2.polled == 3);
    assert(rig.agent("flaky").liveness == Liveness::Errored);

    // Healthy again: back in and voting
    rig.traces["flaky"]->set_healthy(true);
    TickResult r3 = rig.coordinator.tick(rig.state);
    assert(r3.polled == 4);
    assert(rig.agent("flaky").liveness == Liveness::Active);
    assert(std::find(r3.decision->contributors.begin(), r3.decision->contributors.end(), "flaky") !=
           r3.decision->contributors.end());

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_degraded_overlay() {
    std::cout << "Testing degraded overlay..." << std::endl;

    std::vector<AgentSpec> specs = {
        scripted("lead", AgentRole::Strategy, 1.0f, {step("AAPL", "buy", 0.95)}),
        scripted("s1", AgentRole::SignalGenerator, 1.0f, {step("AAPL", "buy", 0.9, 0.2, 300)}),
        scripted("s2", AgentRole::PennyScanner, 1.0f, {step("AAPL", "buy", 0.9, 0.2, 300)}),
        scripted("s3", AgentRole::MarketTiming, 1.0f, {step("AAPL", "buy", 0.9, 0.2, 300)}),
    };
    CoordinatorConfig cc = fast_config();
    cc.agent_timeout = std::chrono::milliseconds(50);
    Rig rig(specs, cc);
    LogCapture capture;
    set_log_sink(capture.sink());

    TickResult r = rig.coordinator.tick(rig.state);
    assert(r.timed_out == 3);
    assert(rig.state.degraded);
    assert(capture.count("degraded_enter") == 1);

    // Decisions continue under a visible ceiling
    assert(r.decision.has_value());
    assert(r.decision->degraded);
    assert(r.decision->consensus <= cc.degraded_consensus_ceiling + 1e-6f);
    assert(r.decision->verdict == Verdict::Approved);

    json snap = snapshot_to_json(rig.state, rig.coordinator.config());
    assert(snap["degraded"] == true);

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_tick_deadline() {
    std::cout << "Testing tick deadline abandonment..." << std::endl;

    auto specs = scenario_agents();
    specs.push_back(scripted("stuck", AgentRole::MarketTiming, 1.0f, {step("AAPL", "buy", 0.9, 0.2, 2000)}));
    CoordinatorConfig cc = fast_config();
    cc.agent_timeout = std::chrono::milliseconds(60);
    cc.tick_deadline = std::chrono::milliseconds(60);
    Rig rig(specs, cc);
    set_log_sink(nullptr);

    TickResult r = rig.coordinator.tick(rig.state);
    assert(r.abandoned);
    assert(!r.decision.has_value());
    assert(rig.state.phase == Phase::Idle);
    assert(rig.state.stats.abandoned == 1);
    assert(rig.state.pending.empty());
    assert(rig.state.recent.empty());

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_deadline_after_collecting() {
    std::cout << "Testing tick deadline while archiving..." << std::endl;

    // Every agent answers in time, but a subscriber to signals is slow to
    // consume, so archiving runs into the tick deadline
    auto specs = scenario_agents();
    AgentSpec watcher = scripted("watcher", AgentRole::RuleSet, 1.0f);
    watcher.interests = {AgentCategory::SignalGeneration, AgentCategory::Coordination};
    specs.push_back(watcher);
    CoordinatorConfig cc = fast_config();
    cc.agent_timeout = std::chrono::milliseconds(100);
    cc.tick_deadline = std::chrono::milliseconds(300);
    Rig rig(specs, cc);
    rig.traces["watcher"]->delay_deliveries(1000);
    LogCapture capture;
    set_log_sink(capture.sink());

    auto started = Clock::now();
    TickResult r = rig.coordinator.tick(rig.state);
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    assert(r.polled == 4);
    assert(r.responded == 4);
    assert(r.timed_out == 0);
    assert(r.abandoned);
    assert(!r.decision.has_value());
    assert(took.count() < 700);
    assert(rig.state.phase == Phase::Idle);
    assert(rig.state.pending.empty());
    assert(rig.state.recent.empty());
    assert(rig.state.portfolio.open_positions == 0);
    assert(rig.state.stats.decisions == 0);
    assert(rig.state.stats.abandoned == 1);
    assert(capture.count("tick_abandoned") == 1);
    assert(capture.count("decision") == 0);

    // Nothing was handed to execution
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(rig.traces["exec"]->handoffs().empty());

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_risk_gate_rejects() {
    std::cout << "Testing risk gate overrides consensus..." << std::endl;

    for (double confidence : {0.0, 0.35, 0.7, 1.0}) {
        std::vector<AgentSpec> specs = {
            scripted("a", AgentRole::Strategy, 2.0f, {step("AAPL", "buy", confidence)}),
            scripted("b", AgentRole::SignalGenerator, 2.0f, {step("AAPL", "buy", confidence)}),
        };
        Rig rig(specs, fast_config());
        set_log_sink(nullptr);
        rig.state.portfolio.open_positions = rig.coordinator.config().risk.max_open_positions;

        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d.has_value());
        assert(d->verdict == Verdict::Rejected);
        assert(!d->violations.empty());
        assert(rig.state.pending.empty());
    }

    // Limits tightened by a risk agent for this tick only
    AgentSpec guard = scripted("guard", AgentRole::RiskManager, 1.0f);
    guard.options["symbol_exposure_cap"] = 0.001;
    std::vector<AgentSpec> specs = {
        scripted("a", AgentRole::Strategy, 1.0f, {step("AAPL", "buy", 0.95)}),
        guard,
    };
    Rig rig(specs, fast_config());
    auto d = rig.coordinator.tick(rig.state).decision;
    assert(d && d->verdict == Verdict::Rejected);
    assert(d->violations[0].find("symbol_exposure_cap") == 0);
    // Risk signals feed the gate, not the vote
    assert(d->contributors == std::vector<std::string>({"a"}));

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_modes_and_inaction() {
    std::cout << "Testing modes, deferral and inaction..." << std::endl;

    // 0.66 clears balanced but not conservative
    CoordinatorConfig cc = fast_config();
    cc.mode = Mode::Conservative;
    {
        Rig rig(scenario_agents(), cc);
        set_log_sink(nullptr);
        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d && d->verdict == Verdict::Deferred);
        assert(rig.state.pending.empty());
        assert(rig.state.phase == Phase::Idle);
        assert(d->position_size <= mode_profile(Mode::Conservative).max_position_risk);
    }

    // Hold wins: no-op, deferred
    {
        std::vector<AgentSpec> specs = {
            scripted("a", AgentRole::Strategy, 1.0f, {step("AAPL", "hold", 0.9)}),
            scripted("b", AgentRole::SignalGenerator, 1.0f, {step("AAPL", "hold", 0.8)}),
        };
        Rig rig(specs, fast_config());
        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d && d->no_op());
        assert(d->verdict == Verdict::Deferred);
        assert(d->position_size == 0.0);
    }

    // Exact tie across symbols: inaction
    {
        std::vector<AgentSpec> specs = {
            scripted("a", AgentRole::Strategy, 1.0f, {step("AAPL", "buy", 0.8, 0.3)}),
            scripted("b", AgentRole::SignalGenerator, 1.0f, {step("TSLA", "sell", 0.8, 0.3)}),
        };
        Rig rig(specs, fast_config());
        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d && d->no_op());
        assert(d->verdict == Verdict::Deferred);
        assert(d->contributors.empty());
    }

    // No signals at all: no decision
    {
        std::vector<AgentSpec> specs = {scripted("a", AgentRole::Strategy, 1.0f)};
        Rig rig(specs, fast_config());
        TickResult r = rig.coordinator.tick(rig.state);
        assert(!r.decision.has_value());
        assert(r.abstained == 1);
        assert(rig.state.stats.decisions == 0);
    }

    // Wide stop shrinks the position
    {
        json wide = step("AAPL", "buy", 0.9);
        wide["numbers"] = {{"entry_price", 100.0}, {"stop_loss", 80.0}};
        std::vector<AgentSpec> specs = {scripted("a", AgentRole::Strategy, 1.0f, {wide})};
        Rig rig(specs, fast_config());
        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d && d->verdict == Verdict::Approved);
        assert(near(d->position_size, (0.02 + 0.03 * 0.9) * 0.1, 1e-4));
    }

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_invalid_signals() {
    std::cout << "Testing malformed signals are dropped..." << std::endl;

    std::vector<AgentSpec> specs = {
        scripted("a", AgentRole::Strategy, 1.0f, {step("AAPL", "buy", 0.8)}),
        scripted("b", AgentRole::SignalGenerator, 1.0f, {step("AAPL", "buy", 1.7)}),
        scripted("c", AgentRole::PennyScanner, 1.0f, {step("AAPL", "buy", 0.5, -0.2)}),
    };
    Rig rig(specs, fast_config());
    LogCapture capture;
    set_log_sink(capture.sink());

    TickResult r = rig.coordinator.tick(rig.state);
    assert(r.invalid == 2);
    assert(capture.count("signal_rejected") == 2);
    assert(r.decision && r.decision->contributors == std::vector<std::string>({"a"}));
    assert(rig.agent("b").liveness == Liveness::Active);

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_memory_outage() {
    std::cout << "Testing learning deferred during a memory outage..." << std::endl;

    Rig rig(scenario_agents(), fast_config());
    set_log_sink(nullptr);

    auto d = rig.coordinator.tick(rig.state).decision;
    assert(d && d->verdict == Verdict::Approved);

    rig.store.set_write_probe([](WriteStage) { return false; });
    auto resolved = rig.coordinator.report_outcome(rig.state, d->id, OutcomeLabel::Failure, -30.0);
    assert(resolved.has_value());
    assert(rig.state.unlearned.size() == 1);
    assert(rig.state.stats.learning_deferred == 1);
    assert(rig.agent("a").weight == 1.0f);

    // Decision-making goes on without new memory
    size_t before = rig.store.size();
    TickResult r = rig.coordinator.tick(rig.state);
    assert(r.decision.has_value());
    assert(r.decision->verdict == Verdict::Approved);
    assert(!r.decision->memory_ref.has_value());
    assert(rig.store.size() == before);
    assert(rig.state.unlearned.size() == 1);

    rig.store.set_write_probe(nullptr);
    assert(rig.coordinator.retry_learning(rig.state) == 1);
    assert(rig.state.unlearned.empty());
    assert(near(rig.agent("a").weight, 0.9));
    assert(near(rig.agent("c").weight, 0.4));
    assert(rig.store.get(*d->memory_ref)->outcome == OutcomeLabel::Failure);

    std::cout << "  PASS" << std::endl;
}

void test_coordinator_unlearned_overflow() {
    std::cout << "Testing unlearned outcome queue overflow..." << std::endl;

    CoordinatorConfig cc = fast_config();
    cc.max_unlearned = 2;
    Rig rig(scenario_agents(), cc);
    LogCapture capture;
    set_log_sink(capture.sink());

    rig.store.set_write_probe([](WriteStage) { return false; });
    for (int i = 0; i < 3; ++i) {
        auto d = rig.coordinator.tick(rig.state).decision;
        assert(d && d->verdict == Verdict::Approved);
        assert(rig.coordinator.report_outcome(rig.state, d->id, OutcomeLabel::Success, 10.0).has_value());
    }

    // The oldest outcome is applied without memory once the queue is full
    assert(capture.count("learning_forced") == 1);
    assert(rig.state.unlearned.size() == 2);
    assert(rig.state.stats.learning_deferred == 3);
    assert(near(rig.agent("a").weight, 1.1));
    assert(near(rig.agent("c").weight, 0.6));

    // The rest follow in order once memory is back
    rig.store.set_write_probe(nullptr);
    assert(rig.coordinator.retry_learning(rig.state) == 2);
    assert(rig.state.unlearned.empty());
    assert(near(rig.agent("a").weight, 1.3));
    assert(near(rig.agent("b").weight, 1.3));
    assert(near(rig.agent("c").weight, 0.8));
    assert(capture.count("learning_forced") == 1);

    set_log_sink(nullptr);
    std::cout << "  PASS" << std::endl;
}

void test_coordinator_registry_errors() {
    std::cout << "Testing registry validation..." << std::endl;

    auto rejects = [](std::vector<AgentSpec> specs) {
        try {
            Coordinator::initial_state(specs);
        } catch (const ConfigurationError&) {
            return true;
        }
        return false;
    };
    assert(rejects({}));
    assert(rejects({scripted("a", AgentRole::Strategy, 1.0f), scripted("a", AgentRole::RuleSet, 1.0f)}));
    assert(rejects({scripted("a", AgentRole::Strategy, 2.5f)}));
    assert(rejects({scripted("a", AgentRole::Strategy, -0.1f)}));
    assert(rejects({scripted("", AgentRole::Strategy, 1.0f)}));
    assert(rejects({scripted(COORDINATOR_ID, AgentRole::Strategy, 1.0f)}));

    auto state = Coordinator::initial_state({scripted("a", AgentRole::Strategy, 1.0f)});
    assert(state.agents.at("a").liveness == Liveness::Starting);
    assert(state.phase == Phase::Idle);

    CoordinatorConfig bad;
    bad.min_active_fraction = 1.5f;
    bool threw = false;
    try {
        bad.validate();
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration and council
// ═══════════════════════════════════════════════════════════════════════════

json base_config(const std::string& dir) {
    json agents = json::array();
    for (const char* id : {"alpha", "beta", "gamma"}) {
        json a = json::object();
        a["id"] = id;
        a["role"] = "strategy";
        a["script"] = json::array({step("AAPL", "buy", 0.8)});
        agents.push_back(a);
    }
    json guard = json::object();
    guard["id"] = "guard";
    guard["role"] = "risk_manager";
    guard["max_open_positions"] = 1;
    agents.push_back(guard);
    json exec = json::object();
    exec["id"] = "broker";
    exec["role"] = "ibkr_trader";
    exec["interests"] = json::array({"coordination"});
    agents.push_back(exec);
    json mem = json::object();
    mem["id"] = "mem";
    mem["role"] = "memory_agent";
    agents.push_back(mem);

    json root = json::object();
    root["logging"] = {{"sink", "none"}};
    root["memory"] = {{"dir", dir}, {"dimension", DIM}};
    root["coordinator"] = {{"mode", "balanced"}, {"agent_timeout_ms", 200},
                           {"tick_deadline_ms", 2000}, {"watchlist", json::array({"AAPL"})}};
    root["risk"] = {{"max_open_positions", 5}, {"max_daily_loss", 1000.0}, {"symbol_exposure_cap", 0.1}};
    root["agents"] = agents;
    return root;
}

void test_config_parsing() {
    std::cout << "Testing configuration parsing..." << std::endl;

    json root = base_config("/tmp/unused");
    root["coordinator"]["consensus_threshold"] = 0.55;
    root["coordinator"]["max_agent_backlog"] = 8;
    SabhaConfig c = parse_config(root);
    assert(c.max_agent_backlog == 8);
    assert(parse_config(base_config("/tmp/unused")).max_agent_backlog == 64);
    assert(c.agents.size() == 6);
    assert(c.agents[0].role == AgentRole::Strategy);
    assert(c.agents[0].options.contains("script"));
    assert(!c.agents[0].options.contains("id"));
    assert(c.agents[4].interests.count(AgentCategory::Coordination));
    assert(c.memory.dimension == DIM);
    assert(c.embedding.dimension == DIM);
    assert(c.coordinator.agent_timeout.count() == 200);
    assert(near(c.coordinator.threshold(), 0.55));
    assert(c.coordinator.risk.max_open_positions == 5);
    assert(c.logging.sink == "none");

    auto error_for = [](const json& j) -> std::string {
        try {
            parse_config(j);
        } catch (const ConfigurationError& e) {
            return e.what();
        }
        return "";
    };

    json no_agents = base_config("/tmp/unused");
    no_agents.erase("agents");
    assert(error_for(no_agents).find("agents") != std::string::npos);

    json no_risk = base_config("/tmp/unused");
    no_risk.erase("risk");
    assert(error_for(no_risk).find("risk") != std::string::npos);

    json bad_role = base_config("/tmp/unused");
    bad_role["agents"][1]["role"] = "astrologer";
    assert(error_for(bad_role).find("agents[1].role") != std::string::npos);

    json heavy = base_config("/tmp/unused");
    heavy["agents"][0]["weight"] = 2.5;
    assert(error_for(heavy).find("agents[0].weight") != std::string::npos);

    json dup = base_config("/tmp/unused");
    dup["agents"][2]["id"] = "alpha";
    assert(error_for(dup).find("duplicate") != std::string::npos);

    json bad_mode = base_config("/tmp/unused");
    bad_mode["coordinator"]["mode"] = "reckless";
    assert(error_for(bad_mode).find("coordinator.mode") != std::string::npos);

    json bad_type = base_config("/tmp/unused");
    bad_type["risk"]["max_daily_loss"] = "lots";
    assert(error_for(bad_type).find("risk.max_daily_loss") != std::string::npos);

    json no_backlog = base_config("/tmp/unused");
    no_backlog["coordinator"]["max_agent_backlog"] = 0;
    assert(error_for(no_backlog).find("coordinator.max_agent_backlog") != std::string::npos);

    bool threw = false;
    try {
        load_config("/nonexistent/sabha.json");
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_council_end_to_end() {
    std::cout << "Testing council end to end..." << std::endl;

    std::string dir = temp_dir();
    set_log_sink(nullptr);
    {
        auto council = boot_council(parse_config(base_config(dir + "/memory")));
        assert(council->store().writable());

        // Tick 1 opens the only allowed position
        TickResult t1 = council->tick();
        assert(t1.decision && t1.decision->verdict == Verdict::Approved);
        auto broker = council->trace("broker");
        assert(broker);
        assert(eventually([&] { return broker->handoffs().size() == 1; }));

        // Tick 2 hits the risk agent's position limit
        TickResult t2 = council->tick();
        assert(t2.decision && t2.decision->verdict == Verdict::Rejected);
        assert(t2.decision->violations[0].find("max_open_positions") == 0);

        council->report_outcome(t1.decision->id, OutcomeLabel::Success, 40.0);

        // Memory now holds a winning precedent for AAPL buys; the memory
        // agent backs it
        TickResult t3 = council->tick();
        assert(t3.decision && t3.decision->verdict == Verdict::Approved);
        const auto& who = t3.decision->contributors;
        assert(std::find(who.begin(), who.end(), "mem") != who.end());

        json snap = council->snapshot();
        assert(snap["agents"].size() == 6);
        assert(snap["recent_decisions"].size() == 3);
        assert(snap["recent_decisions"][0]["outcome"] == "success");
        assert(snap["phase"] == "awaiting_outcome");
        assert(snap["stats"]["approved"] == 2);
        assert(snap["stats"]["rejected"] == 1);
        assert(snap["portfolio"]["open_positions"] == 1);

        RetrievalQuery q;
        q.text = "aapl buy";
        assert(!council->recall("cli", q, 5).empty());

        CouncilStats s = council->stats();
        assert(s.coordination.ticks == 3);
        assert(s.store.records > 0);
        assert(s.output.persisted > 0);
        assert(s.embedder.degraded);
        council->shutdown();
    }
    {
        // Memory outlives the process
        SabhaConfig c = parse_config(base_config(dir + "/memory"));
        Council council(std::move(c));
        council.boot();
        assert(council.store().size() > 0);
        assert(council.state().recent.empty());
    }
    remove_dir(dir);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sabha C++ Tests ===" << std::endl;
    std::cout << "version " << version::string() << ", test dimension " << DIM << std::endl;
    std::cout << std::endl;

    set_log_sink(nullptr);

    test_record_id();
    test_roles();
    test_make_agent_all_roles();

    std::cout << std::endl;
    std::cout << "=== Embedder ===" << std::endl;
    test_text_preprocessing();
    test_hash_backend();
    test_embedder_fallback();
    test_embedder_primary_and_cache();
    test_embedder_search_empty_store();

    std::cout << std::endl;
    std::cout << "=== Memory Store ===" << std::endl;
    test_hnsw_index();
    test_filter_index();
    test_vector_log_torn_tail();
    test_lru_cache();
    test_store_round_trip();
    test_store_validation();
    test_store_update_outcome_idempotent();
    test_store_query();
    test_store_fault_injection();
    test_store_persistence_and_orphans();
    test_store_read_only();
    test_store_sweep();
    test_store_payload_durability();
    test_store_concurrent_reads();

    std::cout << std::endl;
    std::cout << "=== Scoring and Consensus ===" << std::endl;
    test_importance();
    test_relevance();
    test_consensus_weighted_average();
    test_consensus_order_independence();
    test_consensus_no_double_count();
    test_consensus_tie_break();
    test_risk_gates();
    test_weight_bounds();

    std::cout << std::endl;
    std::cout << "=== Routers ===" << std::endl;
    test_output_router_fanout_and_admission();
    test_output_router_persist_failure();
    test_output_router_subscriber_failure();
    test_delivery_backlog_bound();
    test_output_router_annotate();
    test_input_router_empty();
    test_input_router_failure_bias();
    test_input_router_kinds_and_cache();

    std::cout << std::endl;
    std::cout << "=== Coordinator ===" << std::endl;
    test_coordinator_scenario_approved();
    test_coordinator_outcome_learning();
    test_coordinator_outcome_timeout();
    test_coordinator_agent_timeout();
    test_coordinator_agent_crash();
    test_coordinator_degraded_overlay();
    test_coordinator_tick_deadline();
    test_coordinator_deadline_after_collecting();
    test_coordinator_risk_gate_rejects();
    test_coordinator_modes_and_inaction();
    test_coordinator_invalid_signals();
    test_coordinator_memory_outage();
    test_coordinator_unlearned_overflow();
    test_coordinator_registry_errors();

    std::cout << std::endl;
    std::cout << "=== Configuration and Council ===" << std::endl;
    test_config_parsing();
    test_council_end_to_end();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
