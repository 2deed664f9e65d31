#include <stdexcept>
#include <catch2/catch.hpp>
#include <coded/chain.hpp>

using namespace std::string_literals;

namespace
{

struct not_a_std_exception
{
    int value = 0;
};

}  // namespace

TEST_CASE("parse_coder of no error", "[chain]")
{
    coded::registry reg;
    REQUIRE(coded::parse_coder(static_cast<const std::exception*>(nullptr), reg) == nullptr);
    REQUIRE(coded::parse_coder(coded::error_ptr{}, reg) == nullptr);
    REQUIRE(coded::parse_coder(std::exception_ptr{}, reg) == nullptr);
}

TEST_CASE("parse_coder of a chain node", "[chain]")
{
    coded::registry reg;
    auto registered = std::make_shared<coded::default_coder>(100301, 404, "Not found", "ref");
    reg.register_coder(registered);

    SECTION("registered code")
    {
        coded::error err(100301, "missing row");
        REQUIRE(coded::parse_coder(err, reg) == registered);
    }

    SECTION("unregistered code falls back to the unknown coder")
    {
        coded::error err(100399, "not in the catalog");
        auto c = coded::parse_coder(err, reg);
        REQUIRE(c == coded::unknown_coder());
        REQUIRE(c->code() == 1);
        REQUIRE(c->http_status() == 500);
    }

    SECTION("only the outermost code is resolved")
    {
        auto chain = coded::wrap(coded::with_code(100301, "inner"), 100398, "outer");
        REQUIRE(coded::parse_coder(chain, reg) == coded::unknown_coder());
    }

    SECTION("registration after construction")
    {
        coded::error err(100302, "late");
        REQUIRE(coded::parse_coder(err, reg) == coded::unknown_coder());
        reg.register_coder(std::make_shared<coded::default_coder>(100302, 409, "Conflict"));
        REQUIRE(coded::parse_coder(err, reg)->message() == "Conflict"s);
    }
}

TEST_CASE("parse_coder of a non chain error", "[chain]")
{
    coded::registry reg;
    std::runtime_error plain("plain");
    REQUIRE(coded::parse_coder(plain, reg) == coded::unknown_coder());
    REQUIRE(coded::parse_coder(std::make_shared<std::logic_error>("logic"), reg) == coded::unknown_coder());
}

TEST_CASE("parse_coder is repeatable", "[chain]")
{
    coded::registry reg;
    reg.register_coder(std::make_shared<coded::default_coder>(100303, 401, "Unauthorized"));
    coded::error err(100303, "no token");

    auto first = coded::parse_coder(err, reg);
    auto second = coded::parse_coder(err, reg);
    REQUIRE(first != nullptr);
    REQUIRE(*first == *second);
}

TEST_CASE("parse_coder of std::exception_ptr", "[chain]")
{
    coded::registry reg;
    reg.register_coder(std::make_shared<coded::default_coder>(100304, 400, "Bad request"));

    auto coded_ptr = std::make_exception_ptr(coded::error(100304, "bad input"));
    REQUIRE(coded::parse_coder(coded_ptr, reg)->code() == 100304);

    auto plain_ptr = std::make_exception_ptr(std::runtime_error("plain"));
    REQUIRE(coded::parse_coder(plain_ptr, reg) == coded::unknown_coder());

    auto foreign_ptr = std::make_exception_ptr(not_a_std_exception{ 42 });
    REQUIRE(coded::parse_coder(foreign_ptr, reg) == coded::unknown_coder());
}

TEST_CASE("parse_coder uses the process-wide registry by default", "[chain]")
{
    coded::register_coder(100305, 403, "Forbidden");
    coded::error err(100305, "not an admin");
    REQUIRE(coded::parse_coder(err)->http_status() == 403);
    REQUIRE(coded::parse_coder(std::runtime_error("plain")) == coded::unknown_coder());
}

TEST_CASE("is_code walks the chain", "[chain]")
{
    auto chain = coded::wrap(coded::with_code(9, "inner"), 5, "outer");

    REQUIRE(coded::is_code(chain, 5));
    REQUIRE(coded::is_code(chain, 9));
    REQUIRE_FALSE(coded::is_code(chain, 7));

    // repeatable on an unmodified chain
    REQUIRE(coded::is_code(chain, 9));
    REQUIRE_FALSE(coded::is_code(chain, 7));
}

TEST_CASE("is_code stops at a non chain cause", "[chain]")
{
    auto chain = coded::wrap(std::runtime_error("io"), 100306, "read failed");
    REQUIRE(coded::is_code(chain, 100306));
    REQUIRE_FALSE(coded::is_code(chain, 0));

    SECTION("wrapping keeps the inner codes reachable")
    {
        auto outer = coded::wrap(chain, 100307, "outer");
        REQUIRE(coded::is_code(outer, 100306));
        REQUIRE(coded::is_code(outer, 100307));
        REQUIRE_FALSE(coded::is_code(outer, 100308));
    }
}

TEST_CASE("is_code of a non chain error", "[chain]")
{
    std::runtime_error plain("plain");
    REQUIRE_FALSE(coded::is_code(plain, 1));
    REQUIRE_FALSE(coded::is_code(plain, 0));
    REQUIRE_FALSE(coded::is_code(static_cast<const std::exception*>(nullptr), 1));
    REQUIRE_FALSE(coded::is_code(coded::error_ptr{}, 1));
    REQUIRE_FALSE(coded::is_code(std::exception_ptr{}, 1));
}

TEST_CASE("is_code does not need the code to be registered", "[chain]")
{
    coded::error err(100399, "never registered");
    REQUIRE(coded::is_code(err, 100399));
}

TEST_CASE("is_code of std::exception_ptr", "[chain]")
{
    auto chain_ptr = std::make_exception_ptr(
        coded::error(100308, "outer", coded::with_code(100309, "inner")));
    REQUIRE(coded::is_code(chain_ptr, 100308));
    REQUIRE(coded::is_code(chain_ptr, 100309));
    REQUIRE_FALSE(coded::is_code(chain_ptr, 100310));

    REQUIRE_FALSE(coded::is_code(std::make_exception_ptr(std::runtime_error("plain")), 100308));
    REQUIRE_FALSE(coded::is_code(std::make_exception_ptr(not_a_std_exception{ 1 }), 1));
}

TEST_CASE("is_code on a long chain", "[chain]")
{
    coded::error_ptr chain = coded::with_code(100311, "root");
    for (int i = 0; i < 10000; ++i)
        chain = coded::wrap(chain, 100312, "layer");

    REQUIRE(coded::is_code(chain, 100311));
    REQUIRE_FALSE(coded::is_code(chain, 100313));
}

TEST_CASE("a very long chain can be dropped", "[chain]")
{
    {
        coded::error_ptr chain = coded::with_code(7, "root");
        for (int i = 0; i < 1000000; ++i)
            chain = coded::wrap(chain, 100314, "layer");
        REQUIRE(coded::is_code(chain, 7));
    }

    SECTION("a shared part of the chain stays alive")
    {
        coded::error_ptr shared = coded::wrap(coded::with_code(100315, "root"), 100316, "middle");
        {
            coded::error_ptr chain = shared;
            for (int i = 0; i < 1000000; ++i)
                chain = coded::wrap(chain, 100314, "layer");
        }
        REQUIRE(shared.use_count() == 1);
        REQUIRE(coded::is_code(shared, 100315));
        REQUIRE(coded::root_cause(shared.get())->what() == "root"s);
    }
}
