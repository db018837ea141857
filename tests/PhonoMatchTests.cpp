#include "PhonoMatch.hpp"
#include "phonomatch/Analyzer.hpp"
#include "phonomatch/algorithms/GraphemeToPhone.hpp"
#include "phonomatch/CorpusLoader.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace phonomatch;
using algo::MatchStage;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static Sample makeSample(const std::string& id, const std::string& text, const std::string& category,
                         const std::string& transcription, const std::string& phones, double duration) {
    Sample s;
    s.id = id;
    s.text = text;
    s.category = category;
    s.transcription = transcription;
    s.phoneSequence = phones;
    s.durationSeconds = duration;
    s.locale = "en_US";
    return s;
}

static std::vector<Sample> corpus() {
    return {
        makeSample("q_001", "Is Miami the capital of Florida?", "questions",
                   "I z # m aI { m i # D @ # k { p I t @ l # @ v # f l O r I d @ ?",
                   "I z # m aI { m i # D @ # k { p I t @ l # @ v # f l O r I d @", 2.5),
        makeSample("e_001", "Wow!", "exclamations", "w aU !", "w aU", 1.0),
        makeSample("s_001", "We drove to Egypt.", "statements",
                   "w e # D J # 146 r 145 v L I N # 146 $ g E D e",
                   "w e # D J # r v L I N # $ g E D e", 2.0),
        makeSample("s_002", "The capital of France is Paris.", "statements",
                   "D @ # k { p I t @ l # @ v # f r { n s # I z # p { r I s .",
                   "D @ # k { p I t @ l # @ v # f r { n s # I z # p { r I s", 3.0),
        makeSample("q_002", "Where is the capital?", "questions",
                   "w E r # I z # D @ # k { p I t @ l ?",
                   "w E r # I z # D @ # k { p I t @ l", 1.5),
    };
}

template <typename Fn>
static bool throwsNoMatch(Fn fn) {
    try { fn(); } catch (const NoMatchError&) { return true; }
    return false;
}

static void testNormalization() {
    expect(Analyzer::normalize("  Hello,   WORLD!  ") == "hello world", "lowercase, strip, collapse");
    expect(Analyzer::normalize("Don't stop.") == "don't stop", "inner apostrophe kept");
    expect(Analyzer::normalize("?!") == "", "punctuation only normalizes to empty");
    auto words = Analyzer::words("\"Quoted\" -- text");
    expect(words.size() == 2 && words[0] == "quoted" && words[1] == "text", "punctuation-only words dropped");
}

static void testIndexBuild() {
    auto samples = corpus();
    auto idx = buildIndex(samples);
    expect(idx.size() == 5, "five samples indexed");
    expect(idx.entry(0).normalizedText == "is miami the capital of florida", "normalized text");
    expect(idx.entry(0).wordSet.count("florida") == 1, "word set strips punctuation");
    expect(idx.sample("s_001").text == "We drove to Egypt.", "lookup by id");
    expect(idx.findSample("missing") == nullptr, "unknown id is null");

    const auto& capital = idx.samplesWithWord("capital");
    expect(capital == std::vector<CorpusIndex::SampleRef>({0, 3, 4}), "inverted index in corpus order");
    expect(idx.samplesWithWord("nothing").empty(), "unindexed word");

    expect(idx.entry(2).phones.size() == 14, "phones cached from phone sequence");

    auto statements = idx.listCategory("statements");
    expect(statements.size() == 2 && statements[0].id == "s_001" && statements[1].id == "s_002",
           "category listing keeps corpus order");
    bool threw = false;
    try { idx.listCategory("songs"); } catch (const UnknownCategoryError& e) { threw = e.category() == "songs"; }
    expect(threw, "unknown category");

    threw = false;
    try { idx.sample("nope"); } catch (const UnknownSampleIdError& e) { threw = e.id() == "nope"; }
    expect(threw, "unknown sample id");
}

static void testIndexRejectsInvalidCorpus() {
    auto samples = corpus();
    samples.push_back(samples.front());
    bool threw = false;
    try { buildIndex(samples); } catch (const InvalidCorpusError&) { threw = true; }
    expect(threw, "duplicate id rejected");

    samples = corpus();
    samples[1].transcription = "   ";
    threw = false;
    try { buildIndex(samples); } catch (const InvalidCorpusError&) { threw = true; }
    expect(threw, "empty transcription rejected");
}

static void testIndexImmutability() {
    auto samples = corpus();
    auto a = buildIndex(samples);
    auto b = buildIndex(samples);
    expect(a.byId() == b.byId(), "same byId");
    expect(a.invertedWordIndex() == b.invertedWordIndex(), "same inverted index");

    auto before = algo::findBestMatch("paris egypt", a);
    samples[2].text = "Something else entirely";
    samples.push_back(makeSample("x_001", "paris egypt", "statements", "p { r I s", "p { r I s", 1.0));
    auto after = algo::findBestMatch("paris egypt", a);
    expect(before.sampleId == after.sampleId && before.stage == after.stage && before.score == after.score,
           "mutating the input does not change the index");
    expect(a.sample("s_001").text == "We drove to Egypt.", "index holds its own copy");
}

static void testExactStage() {
    auto idx = buildIndex(corpus());
    auto r = algo::findBestMatch("  is MIAMI the capital of florida ", idx);
    expect(r.stage == MatchStage::Exact, "exact stage");
    expect(r.sampleId == "q_001" && r.score == 100.0, "exact match scores 100");
    expect(!r.editDistance, "no distance outside the phonetic stage");

    std::vector<Sample> dupes = {
        makeSample("a", "Hello there", "c", "h @ l oU", "h @ l oU", 1.0),
        makeSample("b", "hello, THERE!", "c", "h @ l oU", "h @ l oU", 1.0),
    };
    auto d = buildIndex(dupes);
    expect(algo::findBestMatch("hello there", d).sampleId == "a", "exact ties go to the first sample");
}

static void testSubstringStage() {
    auto idx = buildIndex(corpus());
    auto r = algo::findBestMatch("capital of", idx);
    expect(r.stage == MatchStage::Substring, "substring stage");
    expect(r.sampleId == "s_002", "closest length wins");
    expect(near(r.score, 75.0 + 25.0 * 10.0 / 30.0), "substring score");

    auto rev = algo::findBestMatch("wow wow wow", idx);
    expect(rev.stage == MatchStage::Substring && rev.sampleId == "e_001", "query containing a sample");
    expect(near(rev.score, 75.0 + 25.0 * 3.0 / 11.0), "reverse containment score");

    for (const auto& q : {"capital", "capital of", "miami", "wow wow wow", "the capital of france"}) {
        auto hit = algo::findBestMatch(q, idx);
        expect(hit.stage == MatchStage::Substring, std::string("substring stage for ") + q);
        expect(hit.score > 75.0 && hit.score < 100.0, std::string("substring score in range for ") + q);
    }

    std::vector<Sample> ties = {
        makeSample("a", "hello there", "c", "h", "h", 1.0),
        makeSample("b", "hello where", "c", "h", "h", 1.0),
    };
    expect(algo::findBestMatch("hello", buildIndex(ties)).sampleId == "a", "substring ties go to the first sample");
}

static void testWordOverlapStage() {
    auto idx = buildIndex(corpus());
    auto r = algo::findBestMatch("paris egypt", idx);
    expect(r.stage == MatchStage::WordOverlap, "word overlap stage");
    expect(r.sampleId == "s_001", "best jaccard wins");
    expect(near(r.score, 10.0), "jaccard 1/5 scaled to 50");

    auto full = algo::findBestMatch("capital the where is", idx);
    expect(full.stage == MatchStage::WordOverlap && full.sampleId == "q_002", "same words, other order");
    expect(full.score == 50.0, "identical word sets score 50");

    std::vector<Sample> ties = {
        makeSample("a", "red apple", "c", "r", "r", 1.0),
        makeSample("b", "green apple", "c", "g", "g", 1.0),
    };
    expect(algo::findBestMatch("apple pie", buildIndex(ties)).sampleId == "a", "overlap ties go to the first sample");

    std::unordered_set<std::string> empty;
    std::unordered_set<std::string> ab = {"a", "b"};
    std::unordered_set<std::string> bc = {"b", "c"};
    expect(algo::jaccardScore(empty, empty) == 0.0, "empty sets score 0");
    expect(algo::jaccardScore(ab, ab) == 50.0, "identical sets score 50");
    expect(near(algo::jaccardScore(ab, bc), 50.0 / 3.0), "partial overlap");
    expect(algo::jaccardScore(ab, {"x"}) == 0.0, "disjoint sets score 0");
}

static void testPhoneticStage() {
    std::vector<Sample> samples = {
        makeSample("a", "alpha", "c", "{ l f @", "{ l f @", 1.0),
        makeSample("b", "bravo", "c", "k { t", "k { t", 1.0),
        makeSample("c", "charlie", "c", "d O g", "d O g", 1.0),
    };
    auto idx = buildIndex(samples);
    auto r = algo::findBestMatch("kat", idx);
    expect(r.stage == MatchStage::Phonetic, "phonetic fallback");
    expect(r.sampleId == "b" && r.score == 40.0, "identical phones score 40");
    expect(r.editDistance && *r.editDistance == 0, "distance reported");
    expect(r.normalizedDistance && *r.normalizedDistance == 0.0, "normalized distance reported");

    auto none = algo::findBestMatch("", idx);
    expect(none.stage == MatchStage::Phonetic && none.sampleId == "a" && none.score == 0.0,
           "empty query still matches the first sample");

    auto other = algo::findBestMatch("zzzz qqq", buildIndex(corpus()));
    expect(other.stage == MatchStage::Phonetic, "unrelated text falls through to phonetic");
    expect(other.score >= 0.0 && other.score <= 40.0, "phonetic score bounded by 40");

    std::vector<std::string> x = {"a", "b", "c"};
    std::vector<std::string> y = {"a", "c"};
    expect(algo::editDistance(x, y) == 1, "one deletion");
    expect(near(algo::normalizedEditDistance(x, y), 1.0 / 3.0), "normalized by the longer side");
    expect(algo::normalizedEditDistance({}, {}) == 0.0, "two empty sequences are identical");
    expect(algo::editDistance(std::string("kitten"), std::string("sitting")) == 3, "string distance");
    expect(algo::editDistance(std::string("kitten"), std::string("sitting"), 1) == 2, "bounded distance stops early");
}

// Best phonetic candidate by full distances over every entry.
static std::optional<algo::PhoneticHit> phoneticByFullScan(const CorpusIndex& idx, const std::vector<std::string>& query) {
    std::optional<algo::PhoneticHit> best;
    for (size_t i = 0; i < idx.entries().size(); ++i) {
        const auto& phones = idx.entries()[i].phones;
        int dist = algo::editDistance(query, phones);
        double norm = algo::normalizedDistance(dist, query.size(), phones.size());
        double score = algo::kPhoneticScale * (1.0 - norm);
        if (!best || score > best->score) best = algo::PhoneticHit{static_cast<CorpusIndex::SampleRef>(i), score, dist, norm};
    }
    return best;
}

static void testPhoneticBoundMatchesFullScan() {
    std::vector<Sample> samples = {
        makeSample("long", "one", "c", "s t r { N g @ r z", "s t r { N g @ r z", 1.0),
        makeSample("far", "two", "c", "m u n", "m u n", 1.0),
        makeSample("near", "three", "c", "s t r { N", "s t r { N", 1.0),
        makeSample("tie", "four", "c", "s t r { p", "s t r { p", 1.0),
        makeSample("short", "five", "c", "s", "s", 1.0),
    };
    std::vector<CorpusIndex> indexes;
    indexes.push_back(buildIndex(samples));
    indexes.push_back(buildIndex(corpus()));

    const std::vector<std::vector<std::string>> queries = {
        {}, {"s"}, {"s", "t", "r", "{", "N"}, {"s", "t", "r", "{", "N", "g"},
        {"m", "u"}, {"z", "z", "z", "z", "z", "z", "z", "z", "z", "z", "z", "z"},
        algo::graphemesToPhones("capital of france"), algo::graphemesToPhones("xylophone"),
    };
    for (const auto& idx : indexes) {
        for (const auto& q : queries) {
            auto pruned = algo::matchPhonetic(idx, q);
            auto full = phoneticByFullScan(idx, q);
            expect(pruned && full, "phonetic stage finds a candidate");
            expect(pruned->ref == full->ref && pruned->distance == full->distance &&
                   pruned->score == full->score && pruned->normalizedDistance == full->normalizedDistance,
                   "bounded phonetic scan agrees with full scan");
        }
    }

    auto near = algo::matchPhonetic(indexes[0], {"s", "t", "r", "{", "N"});
    expect(near && indexes[0].entry(near->ref).sample.id == "near" && near->distance == 0,
           "later exact phone match replaces an earlier partial one");
    auto tie = algo::matchPhonetic(indexes[0], {"s", "t", "r", "{", "x"});
    expect(tie && indexes[0].entry(tie->ref).sample.id == "near" && tie->distance == 1,
           "equal distance keeps the earlier sample");
}

static void testNoMatchAndDeterminism() {
    CorpusIndex empty = buildIndex({});
    expect(throwsNoMatch([&] { algo::findBestMatch("anything", empty); }), "empty index has no match");

    auto idx = buildIndex(corpus());
    for (const auto& q : {"", "wow", "capital", "paris egypt", "xylophone", "!!!"}) {
        auto r1 = algo::findBestMatch(q, idx);
        auto r2 = algo::findBestMatch(q, idx);
        expect(r1.sampleId == r2.sampleId && r1.score == r2.score && r1.stage == r2.stage &&
               r1.editDistance == r2.editDistance, std::string("deterministic for ") + q);
        expect(r1.score >= 0.0 && r1.score <= 100.0, std::string("score in range for ") + q);
    }
}

static void testSearch() {
    auto idx = buildIndex(corpus());
    auto hits = algo::search("capital", idx, 10);
    expect(hits.size() == 3, "three samples mention capital");
    expect(hits[0].ref == 4 && hits[1].ref == 3 && hits[2].ref == 0, "ordered by score");

    auto limited = algo::search("capital", idx, 2);
    expect(limited.size() == 2 && limited[0].ref == 4, "result limit applied");

    auto overlap = algo::search("egypt france", idx, 10);
    expect(overlap.size() == 2 && overlap[0].ref == 2 && overlap[1].ref == 3, "word overlap listing");

    expect(algo::search("", idx, 10).empty(), "empty query finds nothing");
    expect(algo::search("xylophone", idx, 10).empty(), "unrelated query finds nothing");
}

static void testAnalyzeAndStats() {
    auto idx = buildIndex(corpus());
    auto report = analyze("s_001", idx);
    expect(report.wordCount == 4, "analysis of a sample");
    std::vector<StressMark> wantStress = {{2, 146}, {2, 145}, {3, 146}};
    expect(report.stressPattern == wantStress, "stress pattern with word indices");

    bool threw = false;
    try { analyze("missing", idx); } catch (const UnknownSampleIdError&) { threw = true; }
    expect(threw, "analysis of an unknown id");

    auto st = idx.stats();
    expect(st.sampleCount == 5, "sample count");
    expect(st.categoryCounts.size() == 3, "three categories");
    expect(st.categoryNames == std::vector<std::string>({"exclamations", "questions", "statements"}),
           "category names sorted");
    expect(idx.categories() == st.categoryNames, "index and stats list the same categories");
    nlohmann::json sj = st;
    expect(sj["category_names"].size() == 3 && sj["category_names"][0] == "exclamations", "category names serialize");
    expect(st.categoryCounts.at("questions") == 2 && st.categoryCounts.at("exclamations") == 1, "category counts");
    expect(near(st.totalDuration, 10.0) && near(st.averageDuration, 2.0), "durations");
    expect(near(st.categoryDurations.at("statements"), 5.0), "per-category duration");

    auto none = buildIndex({}).stats();
    expect(none.sampleCount == 0 && none.averageDuration == 0.0, "empty stats");
}

static void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static void testLoader(const std::filesystem::path& dir) {
    const auto arrayPath = dir / "corpus.json";
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : corpus()) arr.push_back(nlohmann::json(s));
    arr.push_back({{"utterance_name", "bad_1"}, {"words", ""}, {"transcription", "a"},
                   {"script_title", "c"}, {"phone_sequence", "a"}, {"sentence_estimated_duration", 1.0}});
    arr.push_back({{"utterance_name", "bad_2"}, {"words", "hi"}, {"transcription", "h aI"},
                   {"script_title", "c"}, {"phone_sequence", "h aI"}, {"sentence_estimated_duration", -1.0}});
    nlohmann::json dup = arr[0];
    arr.push_back(dup);
    arr.push_back("not an object");
    writeFile(arrayPath, arr.dump(2));

    CorpusLoader loader(arrayPath.string());
    std::vector<Sample> samples;
    expect(loader.loadAll(samples), "array corpus loads");
    expect(samples.size() == 5 && loader.admitted() == 5, "valid records admitted");
    expect(loader.skipped() == 4, "invalid and duplicate records skipped");
    expect(samples[2] == corpus()[2], "record fields mapped");

    const auto linesPath = dir / "corpus.jsonl";
    std::string lines;
    lines += nlohmann::json(corpus()[0]).dump() + "\n\n";
    lines += "{not json\n";
    lines += R"({"utterance_name":"m_1","words":"Minimal","transcription":"m I n","script_title":"misc","phone_sequence":"m I n","sentence_estimated_duration":0.5})" "\n";
    writeFile(linesPath, lines);

    CorpusLoader jsonl(linesPath.string());
    samples.clear();
    expect(jsonl.loadAll(samples), "json lines corpus loads");
    expect(samples.size() == 2 && jsonl.skipped() == 1, "bad line skipped");
    expect(samples[1].locale.empty() && samples[1].sentenceIdx == 0, "passthrough metadata defaults");

    CorpusLoader missing((dir / "absent.json").string());
    samples.clear();
    expect(!missing.loadAll(samples), "missing file fails the load");

    const auto brokenPath = dir / "broken.json";
    writeFile(brokenPath, "[ {\"utterance_name\": ");
    CorpusLoader broken(brokenPath.string());
    expect(!broken.loadAll(samples), "truncated array fails the load");

    expect(CorpusLoader::validate(nlohmann::json(corpus()[0])).empty(), "serialized sample validates");
}

static void testFacade(const std::filesystem::path& dir) {
    PhonoMatch engine;
    expect(engine.snapshot()->empty(), "starts empty");
    expect(throwsNoMatch([&] { engine.findBestMatch("hello"); }), "empty engine has no match");

    engine.reload(corpus());
    auto old = engine.snapshot();
    expect(old->size() == 5, "reload publishes the new index");
    expect(engine.findBestMatch("is miami the capital of florida").stage == MatchStage::Exact, "facade match");
    expect(engine.search("capital").size() == 3, "facade search lists every related sample");
    expect(engine.search("capital", 1).front().id == "q_002", "facade search with explicit limit");

    {
        PhonoMatch wide;
        std::vector<Sample> many;
        for (size_t i = 0; i < wide.searchLimit() + 2; ++i) {
            many.push_back(makeSample("h_" + std::to_string(i), "hello number " + std::to_string(i), "greetings",
                                      "h @ l oU", "h @ l oU", 1.0));
        }
        wide.reload(many);
        auto all = wide.search("hello");
        expect(all.size() == many.size(), "facade search is not capped by the page size");
        expect(all.front().id == "h_0" && all.back().id == many.back().id, "best score first, corpus order on ties");
    }
    expect(engine.listCategory("statements").size() == 2, "facade category listing");
    expect(engine.getSample("e_001").text == "Wow!", "facade sample lookup");

    auto analysis = engine.analyze("s_001");
    expect(analysis.sample.id == "s_001" && analysis.report.wordCount == 4, "facade analysis");
    nlohmann::json aj = analysis;
    expect(aj["analysis"]["word_count"] == 4, "analysis serializes");
    expect(aj["analysis"]["words"][0][0]["value"] == "w" && aj["analysis"]["words"][0][0]["kind"] == "phone",
           "word units carry their kind");
    expect(aj["analysis"]["words"][2][0]["kind"] == "stress_marker", "stress markers tagged in words");

    auto text = engine.report();
    expect(text.find("Total Samples: 5") != std::string::npos, "report totals");
    expect(text.find("Categories: exclamations, questions, statements") != std::string::npos, "report categories");
    expect(text.find("STATEMENTS:") != std::string::npos, "report breakdown");
    expect(text.find("Average Duration: 2.00s") != std::string::npos, "report average");

    std::vector<Sample> smaller = {corpus()[1]};
    engine.reload(smaller);
    expect(old->size() == 5, "a held snapshot survives a reload");
    expect(engine.snapshot()->size() == 1, "new snapshot visible after reload");

    const auto path = dir / "facade.json";
    nlohmann::json arr = corpus();
    writeFile(path, arr.dump());
    expect(engine.loadCorpus(path.string()), "facade loads a corpus file");
    expect(engine.stats().sampleCount == 5, "loaded corpus published");
    expect(!engine.loadCorpus((dir / "absent.json").string()), "missing corpus keeps the current index");
    expect(engine.stats().sampleCount == 5, "index unchanged after a failed load");
    expect(engine.config()["corpus_path"] == path.string(), "config reports the corpus path");

    PhonoMatch fromFile(path.string());
    expect(fromFile.stats().sampleCount == 5, "constructor loads the corpus");

    nlohmann::json mj = fromFile.findBestMatch("kat");
    expect(mj["stage"] == "phonetic" && mj.contains("edit_distance"), "match result serializes");
}

int main() {
    const std::filesystem::path dataDir = "testdata";
    std::filesystem::remove_all(dataDir);
    std::filesystem::create_directories(dataDir);

    testNormalization();
    testIndexBuild();
    testIndexRejectsInvalidCorpus();
    testIndexImmutability();
    testExactStage();
    testSubstringStage();
    testWordOverlapStage();
    testPhoneticStage();
    testPhoneticBoundMatchesFullScan();
    testNoMatchAndDeterminism();
    testSearch();
    testAnalyzeAndStats();
    testLoader(dataDir);
    testFacade(dataDir);

    std::cout << "All tests passed." << std::endl;
    return 0;
}
