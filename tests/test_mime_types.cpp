#include <gtest/gtest.h>

#include <string>

#include "file/mime_types.hpp"

using namespace pasture::file;

TEST(MimeTypesTest, SniffsBinarySignatures) {
    EXPECT_EQ(sniff_content_type("\x89PNG\r\n\x1a\n rest"), "image/png");
    EXPECT_EQ(sniff_content_type("\xFF\xD8\xFF\xE0"), "image/jpeg");
    EXPECT_EQ(sniff_content_type("GIF89a..."), "image/gif");
    EXPECT_EQ(sniff_content_type("%PDF-1.7"), "application/pdf");
    EXPECT_EQ(sniff_content_type(std::string("\0\0\0\x18" "ftypmp42", 12)), "video/mp4");
    EXPECT_EQ(sniff_content_type(std::string("PK\x03\x04", 4)), "application/zip");
}

TEST(MimeTypesTest, SniffsMarkupLikeText) {
    EXPECT_EQ(sniff_content_type("<!DOCTYPE html>\n<html></html>"), "text/html");
    EXPECT_EQ(sniff_content_type("  \n<html lang=\"en\">"), "text/html");
    EXPECT_EQ(sniff_content_type("<?xml version=\"1.0\"?>"), "text/xml");
    EXPECT_EQ(sniff_content_type("#!/bin/sh\necho hi\n"), "text/x-shellscript");
}

TEST(MimeTypesTest, PlainTextIsNotSniffed) {
    EXPECT_EQ(sniff_content_type("hello world"), "");
    EXPECT_EQ(sniff_content_type(""), "");
    EXPECT_EQ(sniff_content_type("<htmlish"), "");
}

TEST(MimeTypesTest, ExtensionTable) {
    EXPECT_EQ(content_type_for_extension("index.html"), "text/html");
    EXPECT_EQ(content_type_for_extension("INDEX.HTM"), "text/html");
    EXPECT_EQ(content_type_for_extension("style.css"), "text/css");
    EXPECT_EQ(content_type_for_extension("app.js"), "application/javascript");
    EXPECT_EQ(content_type_for_extension("data.json"), "application/json");
    EXPECT_EQ(content_type_for_extension("notes.txt"), "text/plain");
    EXPECT_EQ(content_type_for_extension("photo.jpeg"), "image/jpeg");
    EXPECT_EQ(content_type_for_extension("icon.svg"), "image/svg+xml");
    EXPECT_EQ(content_type_for_extension("clip.webm"), "video/webm");
    EXPECT_EQ(content_type_for_extension("sound.ogg"), "video/ogg");
    EXPECT_EQ(content_type_for_extension("archive.tar.xz"), "application/octet-stream");
    EXPECT_EQ(content_type_for_extension("Makefile"), "application/octet-stream");
}

TEST(MimeTypesTest, ClassifierPrefersContentOverExtension) {
    EXPECT_EQ(classify_content("image.txt", "\x89PNG\r\n\x1a\n"), "image/png");
    EXPECT_EQ(classify_content("notes.txt", "just words"), "text/plain");
    EXPECT_EQ(classify_content("blob", "just words"), "application/octet-stream");
}

TEST(MimeTypesTest, IsoMediaByMajorBrand) {
    auto ftyp = [](const char* brand) { return std::string("\0\0\0\x1C" "ftyp", 8) + brand + std::string(4, '\0'); };
    EXPECT_EQ(sniff_content_type(ftyp("isom")), "video/mp4");
    EXPECT_EQ(sniff_content_type(ftyp("avif")), "image/avif");
    EXPECT_EQ(sniff_content_type(ftyp("heic")), "image/heif");
    EXPECT_EQ(sniff_content_type(ftyp("M4A ")), "audio/m4a");
    EXPECT_EQ(sniff_content_type(ftyp("qt  ")), "video/quicktime");
    EXPECT_EQ(sniff_content_type(ftyp("3gp5")), "video/3gpp");
    EXPECT_EQ(sniff_content_type(ftyp("zzzz")), "");
}

TEST(MimeTypesTest, UnknownBrandFallsBackToExtension) {
    auto bytes = std::string("\0\0\0\x1C" "ftypzzzz", 12);
    EXPECT_EQ(classify_content("clip.webm", bytes), "video/webm");
}
