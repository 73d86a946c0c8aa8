#include "test_common.hpp"

using namespace pathmon;

namespace {
void put16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xff));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

void put32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    put16(out, static_cast<std::uint16_t>(v & 0xffff));
    put16(out, static_cast<std::uint16_t>(v >> 16));
}

// Substitute name first, print name right after it.
std::vector<std::uint8_t> make_reparse(std::uint32_t tag, const std::u16string& subst,
                                       const std::u16string& print, std::uint32_t flags = 0) {
    const bool symlink = tag == kReparseTagSymlink;
    const auto subst_bytes = static_cast<std::uint16_t>(subst.size() * 2);
    const auto print_bytes = static_cast<std::uint16_t>(print.size() * 2);
    std::vector<std::uint8_t> out;
    put32(out, tag);
    put16(out, static_cast<std::uint16_t>(8 + (symlink ? 4 : 0) + subst_bytes + print_bytes));
    put16(out, 0);
    put16(out, 0);
    put16(out, subst_bytes);
    put16(out, subst_bytes);
    put16(out, print_bytes);
    if (symlink)
        put32(out, flags);
    for (char16_t c : subst)
        put16(out, static_cast<std::uint16_t>(c));
    for (char16_t c : print)
        put16(out, static_cast<std::uint16_t>(c));
    return out;
}
} // namespace

TEST_CASE("Mount point buffer yields its absolute target") {
    auto buf = make_reparse(kReparseTagMountPoint, u"\\??\\D:\\Target", u"D:\\Target");
    ReparseTarget t = decode_reparse_buffer(buf.data(), buf.size());
    REQUIRE(t.kind == ReparseKind::MountPoint);
    REQUIRE(t.tag == kReparseTagMountPoint);
    REQUIRE_FALSE(t.relative);
    REQUIRE(t.target == fs::path(u"\\??\\D:\\Target"));
    REQUIRE(strip_namespace(t.target) == fs::path(u"D:\\Target"));
}

TEST_CASE("Symbolic link buffer carries the relative flag") {
    auto rel = make_reparse(kReparseTagSymlink, u"..\\sibling", u"..\\sibling",
                            kSymlinkFlagRelative);
    ReparseTarget t = decode_reparse_buffer(rel.data(), rel.size());
    REQUIRE(t.kind == ReparseKind::Symlink);
    REQUIRE(t.relative);
    REQUIRE(t.target == fs::path(u"..\\sibling"));

    auto abs = make_reparse(kReparseTagSymlink, u"\\??\\C:\\Data", u"C:\\Data", 0);
    ReparseTarget a = decode_reparse_buffer(abs.data(), abs.size());
    REQUIRE(a.kind == ReparseKind::Symlink);
    REQUIRE_FALSE(a.relative);
    REQUIRE(strip_namespace(a.target) == fs::path(u"C:\\Data"));
}

TEST_CASE("Unknown reparse tags are not links") {
    std::vector<std::uint8_t> buf;
    put32(buf, 0x8000001Bu); // IO_REPARSE_TAG_APPEXECLINK
    put16(buf, 4);
    put16(buf, 0);
    put32(buf, 0xdeadbeef);
    ReparseTarget t = decode_reparse_buffer(buf.data(), buf.size());
    REQUIRE(t.kind == ReparseKind::Other);
    REQUIRE(t.target.empty());
}

TEST_CASE("Malformed reparse buffers are rejected") {
    SECTION("shorter than the header") {
        std::vector<std::uint8_t> buf{0x03, 0x00, 0x00, 0xA0};
        REQUIRE_THROWS_AS(decode_reparse_buffer(buf.data(), buf.size()), ReparseDataError);
    }
    SECTION("data length past the end") {
        auto buf = make_reparse(kReparseTagMountPoint, u"\\??\\D:\\T", u"D:\\T");
        buf.resize(buf.size() - 2);
        REQUIRE_THROWS_AS(decode_reparse_buffer(buf.data(), buf.size()), ReparseDataError);
    }
    SECTION("substitute name past the end") {
        auto buf = make_reparse(kReparseTagSymlink, u"abc", u"", 0);
        buf[10] = 0x40; // substitute length 64
        REQUIRE_THROWS_AS(decode_reparse_buffer(buf.data(), buf.size()), ReparseDataError);
    }
    SECTION("odd substitute length") {
        auto buf = make_reparse(kReparseTagMountPoint, u"abc", u"");
        buf[10] = 5;
        REQUIRE_THROWS_AS(decode_reparse_buffer(buf.data(), buf.size()), ReparseDataError);
    }
}

TEST_CASE("strip_namespace leaves ordinary paths alone") {
    REQUIRE(strip_namespace(fs::path(u"C:\\plain")) == fs::path(u"C:\\plain"));
    REQUIRE(strip_namespace(fs::path("/usr/lib")) == fs::path("/usr/lib"));
}
