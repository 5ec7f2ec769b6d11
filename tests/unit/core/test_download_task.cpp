/**
 * @file test_download_task.cpp
 * @brief Unit tests for task validation and task list ingestion
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_download/core/download_task.h>

namespace kcenon::bulk_download::test {

TEST(DownloadTaskTest, MakeValidTask) {
    auto task = download_task::make("https://cdn.example.com/v/intro.mp4",
                                    "/data/course/lesson-1/intro.mp4", "course", "lesson-1",
                                    "video", std::string("https://school.example.com/"));
    ASSERT_TRUE(task.has_value()) << task.error().message;
    EXPECT_EQ(task.value().filename, "intro.mp4");
    EXPECT_EQ(task.value().partial_path(), "/data/course/lesson-1/intro.mp4.part");
    EXPECT_EQ(task.value().partial_path(".tmp"), "/data/course/lesson-1/intro.mp4.tmp");
}

TEST(DownloadTaskTest, ExplicitFilenameWins) {
    auto task = download_task::make("https://cdn.example.com/x", "/data/a/b/001.mp4", "a", "b",
                                    "video", std::nullopt, "Intro Video.mp4");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task.value().filename, "Intro Video.mp4");
}

TEST(DownloadTaskTest, RejectsBadUrl) {
    for (const char* url : {"", "ftp://host/file", "https://", "https:///path", "not a url",
                            "https://host/with space"}) {
        auto task = download_task::make(url, "/data/a/b/f.pdf", "a", "b", "pdf");
        EXPECT_FALSE(task.has_value()) << url;
    }
}

TEST(DownloadTaskTest, RejectsMissingFields) {
    auto no_course = download_task::make("https://h/f", "/data/f.pdf", "", "b", "pdf");
    ASSERT_FALSE(no_course.has_value());
    EXPECT_EQ(no_course.error().code, error_code::missing_task_field);

    auto no_type = download_task::make("https://h/f", "/data/f.pdf", "a", "b", "");
    EXPECT_FALSE(no_type.has_value());

    auto no_path = download_task::make("https://h/f", "", "a", "b", "pdf");
    EXPECT_FALSE(no_path.has_value());

    auto dir_path = download_task::make("https://h/f", "/data/dir/", "a", "b", "pdf");
    EXPECT_FALSE(dir_path.has_value());
}

TEST(DownloadTaskTest, RejectsBadReferer) {
    auto task = download_task::make("https://h/f", "/data/f.pdf", "a", "b", "pdf",
                                    std::string("javascript:alert(1)"));
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().code, error_code::invalid_url);
}

TEST(DownloadTaskTest, UrlValidation) {
    EXPECT_TRUE(is_valid_download_url("http://example.com"));
    EXPECT_TRUE(is_valid_download_url("https://example.com:8443/a?b=c#d"));
    EXPECT_FALSE(is_valid_download_url("https://:80/a"));
    EXPECT_FALSE(is_valid_download_url("example.com/a"));
}

// =============================================================================
// Task list ingestion
// =============================================================================

TEST(TaskListTest, ParsesScraperOutput) {
    auto tasks = parse_task_list(R"([
        {"url": "https://cdn.example.com/1.mp4", "path": "/d/c/l1/1.mp4",
         "filename": "1.mp4", "referer": "https://school.example.com/l1",
         "course_name": "c", "lesson_name": "l1", "file_type": "video"},
        {"url": "https://cdn.example.com/notes.pdf", "destination_path": "/d/c/l1/notes.pdf",
         "course_name": "c", "lesson_name": "l1", "file_type": "pdf"}
    ])");
    ASSERT_TRUE(tasks.has_value()) << tasks.error().message;
    ASSERT_EQ(tasks.value().size(), 2u);

    const auto& first = tasks.value()[0];
    EXPECT_EQ(first.url, "https://cdn.example.com/1.mp4");
    EXPECT_EQ(first.referer, std::optional<std::string>("https://school.example.com/l1"));
    EXPECT_EQ(first.file_type, "video");

    const auto& second = tasks.value()[1];
    EXPECT_EQ(second.destination_path, "/d/c/l1/notes.pdf");
    EXPECT_FALSE(second.referer.has_value());
    EXPECT_EQ(second.filename, "notes.pdf");
}

TEST(TaskListTest, ReportsIndexOfBadTask) {
    auto tasks = parse_task_list(R"([
        {"url": "https://h/1", "path": "/d/1", "course_name": "c", "lesson_name": "l",
         "file_type": "pdf"},
        {"url": "https://h/2", "path": "/d/2", "course_name": "c", "file_type": "pdf"}
    ])");
    ASSERT_FALSE(tasks.has_value());
    EXPECT_EQ(tasks.error().code, error_code::missing_task_field);
    EXPECT_NE(tasks.error().message.find("task #1"), std::string::npos);
}

TEST(TaskListTest, RejectsDuplicateDestinations) {
    auto tasks = parse_task_list(R"([
        {"url": "https://h/1", "path": "/d/x/../f", "course_name": "c", "lesson_name": "l",
         "file_type": "pdf"},
        {"url": "https://h/2", "path": "/d/f", "course_name": "c", "lesson_name": "l",
         "file_type": "pdf"}
    ])");
    ASSERT_FALSE(tasks.has_value());
    EXPECT_EQ(tasks.error().code, error_code::duplicate_destination);
}

TEST(TaskListTest, RejectsNonArrayDocument) {
    auto not_array = parse_task_list(R"({"url": "https://h/1"})");
    ASSERT_FALSE(not_array.has_value());
    EXPECT_EQ(not_array.error().code, error_code::invalid_task);

    EXPECT_FALSE(parse_task_list("[").has_value());
    EXPECT_FALSE(parse_task_list("[42]").has_value());
}

TEST(TaskListTest, EmptyListIsValid) {
    auto tasks = parse_task_list("[]");
    ASSERT_TRUE(tasks.has_value());
    EXPECT_TRUE(tasks.value().empty());
}

}  // namespace kcenon::bulk_download::test
