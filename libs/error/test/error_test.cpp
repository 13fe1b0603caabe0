#include "modkeeper/error.h"

#include <gtest/gtest.h>

using modkeeper::Error;
using modkeeper::ErrorKind;

TEST(ErrorTest, CarriesKindAndMessage) {
    try {
        throw Error(ErrorKind::Conflict, "preset 'Night' already exists");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "preset 'Night' already exists");
        auto* err = dynamic_cast<const Error*>(&e);
        ASSERT_NE(err, nullptr);
        EXPECT_EQ(err->kind(), ErrorKind::Conflict);
    }
}

TEST(ErrorTest, KindNamesAreStable) {
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::Catalog), "catalog");
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::Filesystem), "filesystem");
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::Config), "config");
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::NotFound), "not_found");
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::OrphanedAsset), "orphaned_asset");
    EXPECT_EQ(modkeeper::error_kind_name(ErrorKind::InvalidInput), "invalid_input");
}
