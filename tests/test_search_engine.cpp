#include <doctest/doctest.h>

#include "search_engine.h"
#include "test_helpers.h"

#include <string>
#include <vector>

using fuzzpick::tests::make_catalog;
using fuzzpick::tests::sample_catalog;

namespace {

std::vector<std::string> ids(const std::vector<MatchResult>& results)
{
	std::vector<std::string> out;
	for (const auto& r : results) {
		out.push_back(r.entry->identifier);
	}
	return out;
}

bool is_subsequence(const std::string& query, const std::string& text)
{
	size_t q = 0;
	for (const char c : text) {
		if (q < query.size() && c == query[q]) {
			++q;
		}
	}
	return q == query.size();
}

} // namespace

TEST_CASE("minimal_span finds the shortest window")
{
	const auto span = SearchEngine::minimal_span("abc", "axxbxc abc");
	REQUIRE(span.has_value());
	CHECK(span->length == 3);
	CHECK(span->offset == 7);
}

TEST_CASE("minimal_span prefers the earliest window of equal length")
{
	const auto span = SearchEngine::minimal_span("ab", "xaxb ab ab");
	REQUIRE(span.has_value());
	CHECK(span->length == 2);
	CHECK(span->offset == 5);

	const auto gapped = SearchEngine::minimal_span("ac", "abc abc");
	REQUIRE(gapped.has_value());
	CHECK(gapped->length == 3);
	CHECK(gapped->offset == 0);
}

TEST_CASE("minimal_span rejects out-of-order and oversized queries")
{
	CHECK(!SearchEngine::minimal_span("ba", "ab").has_value());
	CHECK(!SearchEngine::minimal_span("abcd", "abc").has_value());
	CHECK(!SearchEngine::minimal_span("", "abc").has_value());
}

TEST_CASE("matches exactly when the query is a subsequence")
{
	const std::vector<std::string> texts   = {"build project", "bundle assets",
	                                          "say hello", "scripts/mlx.py"};
	const std::vector<std::string> queries = {"b", "bnd", "bp", "ol", "s/m", "xyz",
	                                          "hello", "sm.y", "tt"};

	for (const auto& text : texts) {
		for (const auto& query : queries) {
			CAPTURE(text);
			CAPTURE(query);
			const auto span = SearchEngine::minimal_span(query, text);
			CHECK(span.has_value() == is_subsequence(query, text));
			if (span) {
				CHECK(span->length >= query.size());
				CHECK(span->offset + span->length <= text.size());
			}
		}
	}
}

TEST_CASE("contiguous matches score the query length")
{
	const auto span = SearchEngine::minimal_span("proj", "build project");
	REQUIRE(span.has_value());
	CHECK(span->length == 4);
	CHECK(span->offset == 6);
}

TEST_CASE("single letter ranks build before bundle and drops hello")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	const auto results = engine.filter("b");
	CHECK(ids(results) == std::vector<std::string>{"build", "bundle"});
	CHECK(results[0].score == 1);
	CHECK(results[1].score == 1);
}

TEST_CASE("bnd only matches bundle")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	const auto results = engine.filter("bnd");
	REQUIRE(results.size() == 1);
	CHECK(results[0].entry->identifier == "bundle");
	CHECK(results[0].score == 4);
}

TEST_CASE("empty or blank query keeps the whole catalog in order")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("")) == std::vector<std::string>{"hello", "build", "bundle"});
	CHECK(ids(engine.filter("日本")) == std::vector<std::string>{"hello", "build", "bundle"});
}

TEST_CASE("secondary label is searched")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	const auto results = engine.filter("assets");
	REQUIRE(results.size() == 1);
	CHECK(results[0].entry->identifier == "bundle");
	CHECK(results[0].offset == 7);
}

TEST_CASE("query is matched after normalization")
{
	const auto catalog = make_catalog({{"resume", "Résumé builder"}, {"other", ""}});
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("RÉSUMÉ")) == std::vector<std::string>{"resume"});
	CHECK(ids(engine.filter("sumé b")) == std::vector<std::string>{"resume"});
}

TEST_CASE("labels with Vietnamese and Romanian letters match their ASCII spelling")
{
	const auto catalog = make_catalog({{"vn", "Việt Nam"}, {"ro", "Ștefan cel Mare"}, {"x", ""}});
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("viet")) == std::vector<std::string>{"vn"});
	CHECK(ids(engine.filter("stefan")) == std::vector<std::string>{"ro"});
}

TEST_CASE("whitespace in the query participates literally")
{
	const auto catalog = make_catalog({{"ab", "a b"}, {"a-b", ""}});
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("a b")) == std::vector<std::string>{"ab"});
}

TEST_CASE("equal spans fall back to identifier order regardless of input order")
{
	const auto forward = make_catalog({{"delta", ""}, {"alpha", ""}, {"charlie", ""}});
	const auto reverse = make_catalog({{"charlie", ""}, {"alpha", ""}, {"delta", ""}});

	const SearchEngine a(forward);
	const SearchEngine b(reverse);
	CHECK(ids(a.filter("l")) == ids(b.filter("l")));
	CHECK(ids(a.filter("")) != ids(b.filter("")));

	const auto ties = make_catalog({{"zed-x", ""}, {"abc-x", ""}, {"mid-x", ""}});
	const SearchEngine t(ties);
	CHECK(ids(t.filter("-x")) == std::vector<std::string>{"abc-x", "mid-x", "zed-x"});
}

TEST_CASE("ranking orders by span then offset")
{
	const auto catalog = make_catalog({{"xxab", ""}, {"a_b", ""}, {"ab", ""}});
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("ab")) == std::vector<std::string>{"ab", "xxab", "a_b"});
}

TEST_CASE("filtering is idempotent and always starts from the full catalog")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	CHECK(ids(engine.filter("bu")) == ids(engine.filter("bu")));

	const auto narrowed = engine.filter("bnd");
	REQUIRE(narrowed.size() == 1);
	CHECK(ids(engine.filter("b")) == std::vector<std::string>{"build", "bundle"});
}

TEST_CASE("score reports no match for an unrelated entry")
{
	const auto catalog = sample_catalog();
	const SearchEngine engine(catalog);

	CHECK(!engine.score(catalog.at(0), "zzz").has_value());
	const auto match = engine.score(catalog.at(0), "hlo");
	REQUIRE(match.has_value());
	CHECK(match->entry == &catalog.at(0));
	CHECK(match->score == 5);
}
