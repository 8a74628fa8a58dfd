#include <stencil/path_sanitizer.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace stencil ;

namespace {

std::string sanitized(const std::string &name) {
    std::string res ;
    EXPECT_EQ(sanitizePath(name, res), PathStatus::Valid) << name ;
    return res ;
}

PathStatus status(const std::string &name) {
    std::string res ;
    return sanitizePath(name, res) ;
}

}

TEST(PathSanitizer, empty_name_is_empty) {
    ASSERT_EQ(status(""), PathStatus::Empty) ;
}

TEST(PathSanitizer, plain_name_gets_leading_separator) {
    ASSERT_EQ(sanitized("hello.vm"), "/hello.vm") ;
    ASSERT_EQ(sanitized("/hello.vm"), "/hello.vm") ;
}

TEST(PathSanitizer, collapses_repeated_separators) {
    ASSERT_EQ(sanitized("a//b///c.vm"), "/a/b/c.vm") ;
    ASSERT_EQ(sanitized("//a/"), "/a") ;
}

TEST(PathSanitizer, drops_current_directory_segments) {
    ASSERT_EQ(sanitized("./a/./b.vm"), "/a/b.vm") ;
    ASSERT_EQ(sanitized("."), "/") ;
}

TEST(PathSanitizer, resolves_parent_segments_inside_the_name) {
    ASSERT_EQ(sanitized("a/b/../c.vm"), "/a/c.vm") ;
    ASSERT_EQ(sanitized("a/b/.."), "/a") ;
    ASSERT_EQ(sanitized("a/.."), "/") ;
}

TEST(PathSanitizer, treats_backslash_as_separator) {
    ASSERT_EQ(sanitized("a\\b\\c.vm"), "/a/b/c.vm") ;
}

TEST(PathSanitizer, rejects_climbing_above_the_namespace) {
    ASSERT_EQ(status(".."), PathStatus::Rejected) ;
    ASSERT_EQ(status("../secret"), PathStatus::Rejected) ;
    ASSERT_EQ(status("../../secret"), PathStatus::Rejected) ;
    ASSERT_EQ(status("/../etc/passwd"), PathStatus::Rejected) ;
    ASSERT_EQ(status("a/../../b"), PathStatus::Rejected) ;
    ASSERT_EQ(status("a\\..\\..\\b"), PathStatus::Rejected) ;
}

TEST(PathSanitizer, rejects_embedded_nul) {
    ASSERT_EQ(status(std::string("a.vm\0.txt", 9)), PathStatus::Rejected) ;
}

TEST(PathSanitizer, keeps_dots_inside_segment_names) {
    ASSERT_EQ(sanitized("..a/b..c/...vm"), "/..a/b..c/...vm") ;
}

TEST(PathSanitizer, is_case_sensitive) {
    ASSERT_EQ(sanitized("Hello.VM"), "/Hello.VM") ;
}

TEST(PathSanitizer, does_not_modify_output_on_failure) {
    std::string res = "untouched" ;
    ASSERT_EQ(sanitizePath("../x", res), PathStatus::Rejected) ;
    ASSERT_EQ(res, "untouched") ;
}
