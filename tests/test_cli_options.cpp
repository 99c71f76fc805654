#include <doctest/doctest.h>
#include "cli_options.hpp"
#include <string>

using namespace viamesh;

namespace {

cli::CliOptions parse(const std::string& line) {
    CLI::App app{"viamesh CLI"};
    cli::CliOptions o;
    cli::add_options(app, o);
    app.parse(line, false);
    cli::finish_options(o);
    return o;
}

} // namespace

TEST_CASE("A reliable send from the command line always waits for its ack") {
    cli::CliOptions o = parse("--send BASE --port 10 --reliable --message hello");
    CHECK(o.reliable);
    CHECK(o.wait);
    CHECK(o.send == "BASE");
    CHECK(o.port == 10);

    o = parse("--send BASE --message hello");
    CHECK_FALSE(o.reliable);
    CHECK_FALSE(o.wait);
}

TEST_CASE("Only flags that were given override the settings file") {
    CLI::App app{"viamesh CLI"};
    cli::CliOptions o;
    cli::add_options(app, o);
    app.parse("--listen --baud 9600 --log-level debug", false);

    Settings s;
    s.medium.kind = "serial";
    s.medium.channel = 4000;
    cli::apply_options(o, s);
    CHECK(s.medium.kind == "serial");
    CHECK(s.medium.channel == 4000);
    CHECK(s.medium.baud == 9600);
    CHECK(s.log_level == "debug");
    CHECK(o.listen);
}
