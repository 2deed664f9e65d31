#include <iostream>
#include <stdexcept>

// "coded/coded.hpp" contains everything that you need to work with the error codes
#include <coded/coded.hpp>

// Codes of the application. Code 0 is reserved and code 1 is taken by the unknown coder.
enum app_code
{
    user_not_found = 110001,
    database_error = 110002,
    token_expired = 110003,
};

void register_codes()
{
    // must_register terminates the process if a code is registered twice, so collisions show up at startup
    coded::must_register(user_not_found, 404, "User not found", "https://example.com/docs/errors#110001");
    // HTTP status 0 means "not set" and reads back as 500
    coded::must_register(database_error, 0, "Database error", "https://example.com/docs/errors#110002");
    coded::must_register(token_expired, 401, "Token expired");
}

void query_user(int id)
{
    // a failure of the underlying system
    throw std::runtime_error("connection refused: db-1:5432 (user " + std::to_string(id) + ")");
}

void load_user(int id)
{
    try
    {
        query_user(id);
    }
    catch (const std::runtime_error& e)
    {
        // attach the code to the internal error and keep the internal error as the cause
        throw coded::error(database_error, "can't load the user", std::make_shared<std::runtime_error>(e));
    }
}

void respond(const std::exception& e)
{
    // the internal details (the what() of the chain) stay in the log, the client gets the coder fields only
    auto c = coded::parse_coder(e);
    std::cout << "HTTP " << c->http_status() << " {\"code\": " << c->code() << ", \"message\": \"" << c->message()
              << "\", \"reference\": \"" << c->reference() << "\"}\n";
}

int main()
{
    register_codes();

    try
    {
        load_user(42);
    }
    catch (const coded::error& e)
    {
        std::cerr << "internal: " << e << "\n";
        if (coded::is_code(e, database_error))
            std::cerr << "database is not available\n";
        respond(e);
    }

    // errors the library has never seen get the unknown coder: HTTP 500 and a generic message
    respond(std::logic_error("unexpected state"));

    // the codes work with std::error_code as well
    std::error_code ec = coded::make_error_code(token_expired);
    std::cout << ec.category().name() << ":" << ec.value() << " " << ec.message() << "\n";

    return 0;
}
