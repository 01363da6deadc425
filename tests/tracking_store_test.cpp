#include "errors.hpp"
#include "tracking_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

static TrackedFile tracked(const std::string& path, FileStatus status) {
    TrackedFile tf;
    tf.path = path;
    tf.size = 4096;
    tf.modified_ns = 1700000000000000001LL;
    tf.status = status;
    tf.last_checked_ns = 1700000000500000000LL;
    tf.stable_observed_ns = status == FileStatus::Pending ? 1700000000400000000LL : 0;
    tf.attempts = status == FileStatus::Failed ? 3 : 0;
    return tf;
}

TEST(TrackingStore, MissingFileIsEmpty) {
    TempDir dir;
    TrackingStore store(dir / "state");
    store.load();
    EXPECT_TRUE(store.files().empty());
}

TEST(TrackingStore, SurvivesRestartWithEveryStatus) {
    TempDir dir;
    const std::string odd = (dir / "odd\tname\\with\nbreaks.tar.gz").string();
    {
        TrackingStore store(dir / "state");
        auto& m = store.files();
        m["/w/a.tar.gz"] = tracked("/w/a.tar.gz", FileStatus::Discovered);
        m["/w/b.tar.gz"] = tracked("/w/b.tar.gz", FileStatus::Pending);
        m["/w/c.zip"] = tracked("/w/c.zip", FileStatus::Stable);
        m["/w/d.tar"] = tracked("/w/d.tar", FileStatus::Sent);
        m["/w/e.tar"] = tracked("/w/e.tar", FileStatus::Failed);
        m[odd] = tracked(odd, FileStatus::Sent);
        store.save();
    }

    TrackingStore reopened(dir / "state");
    reopened.load();
    ASSERT_EQ(reopened.files().size(), 6u);
    EXPECT_EQ(*reopened.find("/w/b.tar.gz"), tracked("/w/b.tar.gz", FileStatus::Pending));
    EXPECT_EQ(reopened.find("/w/c.zip")->status, FileStatus::Stable);
    EXPECT_EQ(reopened.find("/w/d.tar")->status, FileStatus::Sent);
    EXPECT_EQ(reopened.find("/w/e.tar")->attempts, 3u);
    ASSERT_NE(reopened.find(odd), nullptr);
    EXPECT_EQ(reopened.find(odd)->status, FileStatus::Sent);
}

TEST(TrackingStore, SaveCreatesParentAndLeavesNoTemp) {
    TempDir dir;
    TrackingStore store(dir / "nested" / "state");
    store.files()["/w/a.tar"] = tracked("/w/a.tar", FileStatus::Stable);
    store.save();
    EXPECT_TRUE(fs::exists(dir / "nested" / "state"));
    EXPECT_FALSE(fs::exists(dir / "nested" / "state.tmp"));
    EXPECT_EQ(read_file(dir / "nested" / "state").rfind("# archive_relay tracking v1\n", 0), 0u);
}

TEST(TrackingStore, MalformedFileIsNotSilentlyForgotten) {
    TempDir dir;
    write_file(dir / "state", "# archive_relay tracking v1\n/w/a.tar\t12\tnot-a-number\tSent\t0\t0\t0\n");
    TrackingStore store(dir / "state");
    EXPECT_THROW(store.load(), StorageError);

    write_file(dir / "state", "# archive_relay tracking v1\n/w/a.tar\t12\t5\tShipped\t0\t0\t0\n");
    EXPECT_THROW(store.load(), StorageError);

    write_file(dir / "state", "# archive_relay tracking v1\n/w/a.tar\t12\t5\n");
    EXPECT_THROW(store.load(), StorageError);

    write_file(dir / "state", "# something else v9\n");
    EXPECT_THROW(store.load(), StorageError);
}

TEST(FileStatus, NamesRoundTrip) {
    for (auto s : {FileStatus::Discovered, FileStatus::Pending, FileStatus::Stable, FileStatus::Sent,
                   FileStatus::Failed}) {
        EXPECT_EQ(file_status_from_string(to_string(s)), s);
    }
    EXPECT_FALSE(file_status_from_string("sent").has_value());
}
