#include "device_directory.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace {

DeviceDirectory sample_directory() {
    std::vector<AudioDevice> devices = {
        make_device("Built-in Microphone", 2, 0),
        make_device("Built-in Output", 0, 2),
        make_device("CABLE Input", 0, 8),
        make_device("CABLE Output", 8, 0),
        make_device("USB Headset", 1, 2),
    };
    devices[4].description = "Logitech USB Headset";
    return DeviceDirectory(devices);
}

} // namespace

TEST(DeviceDirectoryTest, IndicesFollowEnumerationOrder) {
    DeviceDirectory directory = sample_directory();
    ASSERT_EQ(directory.list_devices().size(), 5u);
    for (std::size_t i = 0; i < directory.list_devices().size(); ++i) {
        EXPECT_EQ(directory.list_devices()[i].index, static_cast<int>(i));
    }
    EXPECT_EQ(directory.device(2)->name, "CABLE Input");
    EXPECT_EQ(directory.device(5), nullptr);
    EXPECT_EQ(directory.device(-1), nullptr);
}

TEST(DeviceDirectoryTest, EnumerateUsesBackendSnapshot) {
    FakeAudioBackend backend({make_device("a", 1, 0), make_device("b", 0, 1)});
    DeviceDirectory directory = DeviceDirectory::enumerate(backend);
    EXPECT_EQ(backend.list_calls, 1);
    EXPECT_EQ(directory.list_devices().size(), 2u);
}

TEST(DeviceDirectoryTest, ContainsMatchRespectsDirection) {
    DeviceDirectory directory = sample_directory();
    EXPECT_EQ(directory.find_contains("cable", Direction::Output), 2);
    EXPECT_EQ(directory.find_contains("cable", Direction::Input), 3);
    EXPECT_EQ(directory.find_contains("Built-in", Direction::Input), 0);
    EXPECT_EQ(directory.find_contains("Built-in", Direction::Output), 1);
    EXPECT_EQ(directory.find_contains("headset", Direction::Input), 4);
    EXPECT_FALSE(directory.find_contains("speaker", Direction::Output).has_value());
}

TEST(DeviceDirectoryTest, EmptyNameMatchesNothing) {
    DeviceDirectory directory = sample_directory();
    EXPECT_FALSE(directory.find_contains("", Direction::Output).has_value());
    EXPECT_FALSE(directory.find_exact("  ", Direction::Input).has_value());
    EXPECT_FALSE(directory.has_device_named(""));
}

TEST(DeviceDirectoryTest, ExactMatchIsWholeName) {
    DeviceDirectory directory = sample_directory();
    EXPECT_EQ(directory.find_exact(" cable output ", Direction::Input), 3);
    EXPECT_FALSE(directory.find_exact("CABLE", Direction::Input).has_value());
    EXPECT_FALSE(directory.find_exact("CABLE Output", Direction::Output).has_value());
}

TEST(DeviceDirectoryTest, HasDeviceNamedIgnoresDirection) {
    DeviceDirectory directory = sample_directory();
    EXPECT_TRUE(directory.has_device_named("cable input"));
    EXPECT_TRUE(directory.has_device_named("USB Headset"));
    EXPECT_FALSE(directory.has_device_named("USB"));
    EXPECT_FALSE(directory.has_device_named(" cable input "));
}

TEST(DeviceDirectoryTest, DescribeListsEveryDevice) {
    DeviceDirectory directory = sample_directory();
    std::string text = directory.describe();
    EXPECT_NE(text.find("0: Built-in Microphone"), std::string::npos);
    EXPECT_NE(text.find("4: USB Headset [Logitech USB Headset] (in=1, out=2"), std::string::npos);
}

TEST(DeviceDirectoryTest, NotFoundStatusCarriesDeviceList) {
    DeviceDirectory directory = sample_directory();
    Status status = directory.not_found_status("Audio output device", "Speakers", Direction::Output);
    EXPECT_EQ(status.kind(), ErrorKind::DeviceNotFound);
    EXPECT_NE(status.message().find("'Speakers'"), std::string::npos);
    EXPECT_NE(status.message().find("CABLE Output"), std::string::npos);
}
