#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    REQUIRE(clinic_voice::utils::url_encode("hello world!") == "hello%20world%21");
    REQUIRE(clinic_voice::utils::url_encode("nova-2_x.y~") == "nova-2_x.y~");
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    clinic_voice::utils::parse_url("https://example.com:8443/path/file",
                                   scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url picks default ports for secure websocket schemes") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    clinic_voice::utils::parse_url("wss://api.deepgram.com/v1/listen", scheme, host, port,
                                   base_path);
    REQUIRE(scheme == "wss");
    REQUIRE(port == 443);
    clinic_voice::utils::parse_url("http://localhost", scheme, host, port, base_path);
    REQUIRE(host == "localhost");
    REQUIRE(port == 80);
    REQUIRE(base_path == "/");
}

TEST_CASE("append_query adds encoded parameters after existing ones") {
    REQUIRE(clinic_voice::utils::append_query("wss://host/listen", {{"model", "nova-2"},
                                                                   {"channels", "1"}}) ==
            "wss://host/listen?channels=1&model=nova-2");
    REQUIRE(clinic_voice::utils::append_query("https://host/x?a=1", {{"q", "a b"}}) ==
            "https://host/x?a=1&q=a%20b");
}

TEST_CASE("join_path leaves exactly one slash between segments") {
    REQUIRE(clinic_voice::utils::join_path("", "/v1/embeddings") == "/v1/embeddings");
    REQUIRE(clinic_voice::utils::join_path("/", "api/chat") == "/api/chat");
    REQUIRE(clinic_voice::utils::join_path("/proxy/", "/v1/chat") == "/proxy/v1/chat");
    REQUIRE(clinic_voice::utils::join_path("/proxy", "v1/chat") == "/proxy/v1/chat");
    REQUIRE(clinic_voice::utils::join_path("/proxy", "") == "/proxy");
}
