#include <gtest/gtest.h>

#include "http/multipart.h"

#include <algorithm>

namespace {

std::string file_part(const std::string& boundary, const std::string& name,
                      const std::string& content) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + name + "\"\r\n"
           "Content-Type: application/octet-stream\r\n\r\n" +
           content + "\r\n";
}

} // namespace

TEST(MultipartTest, BoundaryFromContentType) {
    EXPECT_EQ(parse_boundary("multipart/form-data; boundary=abc123"), "abc123");
    EXPECT_EQ(parse_boundary("multipart/form-data; boundary=\"quoted-b\""), "quoted-b");
    EXPECT_EQ(parse_boundary("multipart/form-data; boundary=abc; charset=utf-8"), "abc");
    EXPECT_EQ(parse_boundary("multipart/form-data; BOUNDARY=Case"), "Case");
}

TEST(MultipartTest, BoundaryMissingOrEmpty) {
    EXPECT_FALSE(parse_boundary("multipart/form-data").has_value());
    EXPECT_FALSE(parse_boundary("multipart/form-data; boundary=").has_value());
    EXPECT_FALSE(parse_boundary("").has_value());
}

TEST(MultipartTest, FilenameFromContentDisposition) {
    EXPECT_EQ(extract_filename("form-data; name=\"file\"; filename=\"a.txt\""), "a.txt");
    EXPECT_EQ(extract_filename("form-data; filename=\"photo 1.jpg\"; name=\"f\""), "photo 1.jpg");
    EXPECT_EQ(extract_filename("attachment;filename=\"x.bin\""), "x.bin");
}

TEST(MultipartTest, FilenameAbsentOrMalformed) {
    EXPECT_FALSE(extract_filename("").has_value());
    EXPECT_FALSE(extract_filename("form-data; name=\"comment\"").has_value());
    EXPECT_FALSE(extract_filename("form-data; filename=\"\"").has_value());
    EXPECT_FALSE(extract_filename("form-data; filename=\"unterminated").has_value());
    EXPECT_FALSE(extract_filename("form-data; name=\"x\"; myfilename=\"a.txt\"").has_value());
}

TEST(MultipartTest, ParsesFileAndFieldParts) {
    const std::string b = "----WebKitFormBoundary7MA4YWxkTrZu0gW";
    const std::string body =
        file_part(b, "a.txt", "0123456789") +
        "--" + b + "\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n\r\n"
        "hello\r\n"
        "--" + b + "--\r\n";

    const auto parts = parse_multipart(body, b);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].body, "0123456789");
    EXPECT_EQ(extract_filename(parts[0].header("content-disposition")), "a.txt");
    EXPECT_EQ(parts[0].header("Content-Type"), "application/octet-stream");
    EXPECT_EQ(parts[1].body, "hello");
    EXPECT_FALSE(extract_filename(parts[1].header("Content-Disposition")).has_value());
}

TEST(MultipartTest, BinaryContentIsPreserved) {
    const std::string b = "XyZ";
    std::string content("\0\r\n--X\xff\r\n", 9);
    const auto parts = parse_multipart(file_part(b, "bin.dat", content) + "--XyZ--", b);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body, content);
}

TEST(MultipartTest, PreambleIsIgnored) {
    const std::string body = "this is a preamble\r\n" + file_part("b", "p.txt", "data") + "--b--";
    const auto parts = parse_multipart(body, "b");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body, "data");
}

TEST(MultipartTest, EmptyMultipartHasNoParts) {
    EXPECT_TRUE(parse_multipart("--b--\r\n", "b").empty());
}

TEST(MultipartTest, MalformedStreamsThrow) {
    EXPECT_THROW(parse_multipart("no boundaries here", "b"), MultipartError);
    EXPECT_THROW(parse_multipart(file_part("b", "a.txt", "abc"), "b"), MultipartError);
    EXPECT_THROW(parse_multipart("--b\r\nContent-Disposition: form-data", "b"), MultipartError);
    EXPECT_THROW(parse_multipart("--bX\r\n\r\nabc\r\n--b--", "b"), MultipartError);
    EXPECT_THROW(parse_multipart("--b\r\n\r\nabc\r\n--b--", ""), MultipartError);
}

TEST(MultipartTest, FilenameWithEscapedQuotes) {
    EXPECT_EQ(extract_filename(R"(form-data; name="file"; filename="my \"best\" shot.jpg")"),
              "my \"best\" shot.jpg");
    EXPECT_EQ(extract_filename(R"(form-data; filename="back\\slash.txt")"), "back\\slash.txt");
}

TEST(MultipartReaderTest, SplitsAcrossArbitraryChunks) {
    const std::string b = "chunky";
    const std::string first(3000, 'f');
    const std::string body = file_part(b, "one.bin", first) +
                             "--" + b + "\r\n\r\nheaderless\r\n" +
                             file_part(b, "two.txt", "2") + "--" + b + "--\r\nepilogue";

    for (std::size_t chunk = 1; chunk <= 13; chunk += 3) {
        std::vector<MultipartPart> parts;
        MultipartReader reader(b);
        reader.set_on_part_begin([&parts](const std::map<std::string, std::string>& headers) {
            parts.push_back(MultipartPart{headers, {}});
        });
        reader.set_on_part_data([&parts](const char* data, std::size_t size) {
            parts.back().body.append(data, size);
        });

        for (std::size_t pos = 0; pos < body.size(); pos += chunk) {
            reader.feed(body.data() + pos, std::min(chunk, body.size() - pos));
        }
        EXPECT_NO_THROW(reader.finish());
        EXPECT_TRUE(reader.done());

        ASSERT_EQ(parts.size(), 3u) << "chunk size " << chunk;
        EXPECT_EQ(parts[0].body, first);
        EXPECT_TRUE(parts[1].headers.empty());
        EXPECT_EQ(parts[1].body, "headerless");
        EXPECT_EQ(extract_filename(parts[2].header("Content-Disposition")), "two.txt");
        EXPECT_EQ(parts[2].body, "2");
    }
}

TEST(MultipartReaderTest, FinishReportsIncompleteStreams) {
    MultipartReader empty("b");
    EXPECT_THROW(empty.finish(), MultipartError);

    MultipartReader mid_headers("b");
    const std::string partial = "--b\r\nContent-Disposition: form-data";
    mid_headers.feed(partial.data(), partial.size());
    EXPECT_THROW(mid_headers.finish(), MultipartError);

    EXPECT_THROW(MultipartReader(""), MultipartError);
}
