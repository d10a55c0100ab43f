#include <gtest/gtest.h>
#include "services/local_source_storage.h"
#include "exceptions/media_exceptions.h"
#include "utils/logger.h"
#include "test_helpers/test_constants.h"
#include "test_helpers/test_builders.h"
#include "test_helpers/test_file_manager.h"
#include <thread>

using namespace lumen;
using namespace lumen::test_constants;
using namespace lumen::test_builders;
using namespace lumen::test_helpers;

class LocalSourceStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("lumen-test", "error", Logger::Format::TEXT, "test");

        root_ = std::make_unique<TempDirectory>("sources_");
        storage_ = std::make_unique<LocalSourceStorage>(root_->str());
    }

    std::unique_ptr<TempDirectory> root_;
    std::unique_ptr<LocalSourceStorage> storage_;
};

TEST_F(LocalSourceStorageTest, Resolve_ExistingFile_ReturnsBytesAndFingerprint) {
    // Arrange
    auto bytes = TestDataBuilder::createBinaryData(MEDIUM_DATA_SIZE);
    ASSERT_TRUE(TestFileManager::writeFile(*root_ / PRODUCT_IMAGE_PATH, bytes));

    // Act
    SourceAsset asset = storage_->resolve(PRODUCT_IMAGE_PATH);

    // Assert
    EXPECT_EQ(bytes, asset.bytes);
    EXPECT_EQ(storage_->fingerprint(PRODUCT_IMAGE_PATH), asset.fingerprint)
        << "resolve and fingerprint must agree for an unchanged file";
    EXPECT_EQ(0u, asset.fingerprint.find(std::to_string(MEDIUM_DATA_SIZE) + "-"))
        << "Fingerprint starts with the file size";
}

TEST_F(LocalSourceStorageTest, Fingerprint_MissingFile_ThrowsNotFound) {
    EXPECT_THROW(storage_->fingerprint(MISSING_IMAGE_PATH), exceptions::NotFoundException);
    EXPECT_THROW(storage_->resolve(MISSING_IMAGE_PATH), exceptions::NotFoundException);
}

TEST_F(LocalSourceStorageTest, Fingerprint_Directory_ThrowsNotFound) {
    std::filesystem::create_directories(*root_ / "products/dir.jpg");

    EXPECT_THROW(storage_->fingerprint("products/dir.jpg"), exceptions::NotFoundException);
}

TEST_F(LocalSourceStorageTest, Fingerprint_RewrittenFile_Changes) {
    // Arrange
    ASSERT_TRUE(TestFileManager::writeFile(*root_ / PRODUCT_IMAGE_PATH, TEST_CONTENT));
    std::string before = storage_->fingerprint(PRODUCT_IMAGE_PATH);

    // Act
    ASSERT_TRUE(TestFileManager::writeFile(*root_ / PRODUCT_IMAGE_PATH, TEST_CONTENT + "!"));
    std::string after = storage_->fingerprint(PRODUCT_IMAGE_PATH);

    // Assert
    EXPECT_NE(before, after);
}

TEST_F(LocalSourceStorageTest, Fingerprint_SameSizeRewrite_ChangesWithMtime) {
    auto path = *root_ / PRODUCT_IMAGE_PATH;
    ASSERT_TRUE(TestFileManager::writeFile(path, "aaaa"));
    std::string before = storage_->fingerprint(PRODUCT_IMAGE_PATH);

    ASSERT_TRUE(TestFileManager::writeFile(path, "bbbb"));
    std::filesystem::last_write_time(path,
        std::filesystem::last_write_time(path) + std::chrono::seconds(2));

    EXPECT_NE(before, storage_->fingerprint(PRODUCT_IMAGE_PATH));
}

TEST_F(LocalSourceStorageTest, GetStorageName_ReturnsRoot) {
    EXPECT_EQ(root_->str(), storage_->getStorageName());
}
