#include <catch2/catch_test_macros.hpp>

#include "clinic_voice/utils/text.hpp"

#include <string>

TEST_CASE("clean_for_speech drops emoji and collapses the gap") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    REQUIRE(clinic_voice::utils::clean_for_speech("Hello " + emoji + " world") == "Hello world");
    const std::string thumbs = "\xF0\x9F\x91\x8D\xEF\xB8\x8F";
    REQUIRE(clinic_voice::utils::clean_for_speech("See you soon " + thumbs) == "See you soon");
}

TEST_CASE("clean_for_speech removes markdown emphasis and headings") {
    REQUIRE(clinic_voice::utils::clean_for_speech("## Hours\n**Monday** to `Friday`") ==
            "Hours Monday to Friday");
}

TEST_CASE("clean_for_speech leaves plain and accented text untouched") {
    REQUIRE(clinic_voice::utils::clean_for_speech("Plain text only.") == "Plain text only.");
    const std::string accented = "caf\xC3\xA9 au lait";
    REQUIRE(clinic_voice::utils::clean_for_speech(accented) == accented);
    const std::string broken = "ok \xC3";
    REQUIRE(clinic_voice::utils::clean_for_speech(broken) == broken);
}

TEST_CASE("normalize_text lowercases and collapses whitespace") {
    REQUIRE(clinic_voice::utils::normalize_text("  Hello\tWORLD  ") == "hello world");
    REQUIRE(clinic_voice::utils::normalize_text("What  are\nyour hours?") ==
            "what are your hours?");
}

TEST_CASE("count_words counts whitespace separated tokens") {
    REQUIRE(clinic_voice::utils::count_words("") == 0);
    REQUIRE(clinic_voice::utils::count_words("  wait ") == 1);
    REQUIRE(clinic_voice::utils::count_words("hold on\tplease") == 3);
}

TEST_CASE("xml_escape protects attribute values") {
    REQUIRE(clinic_voice::utils::xml_escape("wss://a?x=1&y=\"2\"") ==
            "wss://a?x=1&amp;y=&quot;2&quot;");
}
