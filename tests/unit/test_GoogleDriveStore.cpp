#include <gtest/gtest.h>
#include "drive/store/GoogleDriveStore.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace dt::drive::store;
using namespace dt::drive::model;

TEST(GoogleDriveStoreTest, FieldMaskFollowsSelection) {
    EXPECT_EQ(GoogleDriveStore::fieldMask(fields::ID), "id");
    EXPECT_EQ(GoogleDriveStore::fieldMask(fields::KIND), "id,name,mimeType");
    EXPECT_EQ(GoogleDriveStore::fieldMask(fields::INFO), "id,name,mimeType,size,createdTime,modifiedTime");
    EXPECT_EQ(GoogleDriveStore::fieldMask(fields::HASH), "id,name,mimeType,md5Checksum");
    EXPECT_EQ(GoogleDriveStore::fieldMask(fields::ANCESTRY | Field::Trashed), "id,name,parents,trashed");
}

class AccessTokenTest : public ::testing::Test {
protected:
    fs::path tokenFile;
    dt::config::StoreConfig cnf;

    void SetUp() override {
        tokenFile = fs::temp_directory_path() / "drivetree_token_test";
        cnf.access_token_env = "DRIVETREE_TOKEN_UNDER_TEST";
        unsetenv(cnf.access_token_env.c_str());
    }

    void TearDown() override {
        fs::remove(tokenFile);
        unsetenv(cnf.access_token_env.c_str());
    }
};

TEST_F(AccessTokenTest, FromFileWithoutTrailingWhitespace) {
    {
        std::ofstream out(tokenFile);
        out << "ya29.secret  \n";
    }
    cnf.access_token_file = tokenFile;
    EXPECT_EQ(GoogleDriveStore::loadAccessToken(cnf), "ya29.secret");
}

TEST_F(AccessTokenTest, FromEnvironment) {
    setenv(cnf.access_token_env.c_str(), "env-token", 1);
    EXPECT_EQ(GoogleDriveStore::loadAccessToken(cnf), "env-token");
}

TEST_F(AccessTokenTest, MissingTokenFails) {
    EXPECT_THROW((void)GoogleDriveStore::loadAccessToken(cnf), std::runtime_error);

    cnf.access_token_file = tokenFile;
    EXPECT_THROW((void)GoogleDriveStore::loadAccessToken(cnf), std::runtime_error);
}
