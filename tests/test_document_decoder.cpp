#include <catch2/catch_test_macros.hpp>
#include "batch/document_decoder.hpp"

#include <string>

using namespace sentinel;

namespace {

std::string bytes_of(std::initializer_list<int> values) {
    std::string out;
    for (int v : values) out += static_cast<char>(v);
    return out;
}

} // anonymous namespace

TEST_CASE("DocumentDecoder: plain UTF-8 text passes through", "[document_decoder]") {
    DocumentDecoder decoder;
    auto r = decoder.decode("notes.txt", "hello world");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "hello world");

    r = decoder.decode("hindi.md", "नमस्ते");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "नमस्ते");

    r = decoder.decode("empty.txt", "");
    REQUIRE(r.is_ok());
    CHECK(r.value().empty());
}

TEST_CASE("DocumentDecoder: extension allow-list is case-insensitive", "[document_decoder]") {
    DocumentDecoder decoder;
    CHECK(decoder.extension_allowed("REPORT.TXT"));
    CHECK(decoder.extension_allowed("data.Csv"));
    CHECK(decoder.extension_allowed("dir/config.yaml"));
    CHECK_FALSE(decoder.extension_allowed("scan.pdf"));
    CHECK_FALSE(decoder.extension_allowed("archive.zip"));
    CHECK_FALSE(decoder.extension_allowed("txt"));

    auto r = decoder.decode("scan.pdf", "%PDF-1.7");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNSUPPORTED_DOCUMENT);
    CHECK(r.error_message().find("scan.pdf") != std::string::npos);
}

TEST_CASE("DocumentDecoder: empty allow-list accepts any name", "[document_decoder]") {
    DocumentDecoder::Config cfg;
    cfg.allowed_extensions.clear();
    DocumentDecoder decoder(cfg);
    CHECK(decoder.extension_allowed("anything.bin"));
    CHECK(decoder.decode("<stdin>", "text").is_ok());
}

TEST_CASE("DocumentDecoder: UTF-8 BOM is stripped", "[document_decoder]") {
    DocumentDecoder decoder;
    auto r = decoder.decode("bom.txt", bytes_of({0xEF, 0xBB, 0xBF}) + "abc");
    REQUIRE(r.is_ok());
    CHECK(r.value() == "abc");
}

TEST_CASE("DocumentDecoder: UTF-16 and UTF-32 are rejected", "[document_decoder]") {
    DocumentDecoder decoder;

    auto r = decoder.decode("le.txt", bytes_of({0xFF, 0xFE, 'a', 0x00}));
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("UTF-16") != std::string::npos);

    r = decoder.decode("be.txt", bytes_of({0xFE, 0xFF, 0x00, 'a'}));
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("UTF-16") != std::string::npos);

    r = decoder.decode("le32.txt", bytes_of({0xFF, 0xFE, 0x00, 0x00, 'a', 0x00, 0x00, 0x00}));
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("UTF-32") != std::string::npos);
}

TEST_CASE("DocumentDecoder: binary content is rejected", "[document_decoder]") {
    DocumentDecoder decoder;
    auto r = decoder.decode("blob.txt", bytes_of({'a', 'b', 0x00, 'c'}));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNSUPPORTED_DOCUMENT);
    CHECK(r.error_message().find("offset 2") != std::string::npos);
}

TEST_CASE("DocumentDecoder: invalid UTF-8 is located", "[document_decoder]") {
    using npos_t = decltype(std::string_view::npos);
    constexpr npos_t npos = std::string_view::npos;

    CHECK(DocumentDecoder::find_invalid_utf8("plain ascii") == npos);
    CHECK(DocumentDecoder::find_invalid_utf8("€ and 𝄞") == npos);

    // Lone continuation byte
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({'a', 0x80})) == 1);
    // Truncated 3-byte sequence
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({'x', 'y', 0xE2, 0x82})) == 2);
    // Overlong encoding of '/'
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({0xC0, 0xAF})) == 0);
    // UTF-16 surrogate half
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({0xED, 0xA0, 0x80})) == 0);
    // Beyond U+10FFFF
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({0xF4, 0x90, 0x80, 0x80})) == 0);
    // Latin-1 byte
    CHECK(DocumentDecoder::find_invalid_utf8(bytes_of({'c', 'a', 'f', 0xE9})) == 3);

    DocumentDecoder decoder;
    auto r = decoder.decode("latin1.txt", bytes_of({'c', 'a', 'f', 0xE9}));
    REQUIRE(r.is_error());
    CHECK(r.error_message().find("UTF-8") != std::string::npos);
}

TEST_CASE("DocumentDecoder: size limit", "[document_decoder]") {
    DocumentDecoder::Config cfg;
    cfg.max_document_bytes = 4;
    DocumentDecoder decoder(cfg);

    CHECK(decoder.decode("ok.txt", "abcd").is_ok());
    auto r = decoder.decode("big.txt", "abcde");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::UNSUPPORTED_DOCUMENT);
}
