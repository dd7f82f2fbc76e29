#pragma once
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

#include "evdev/key_device.hpp"
#include "file_descriptor.hpp"

namespace testing_support {

// mkdtemp() directory, removed recursively on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name, const std::string& content = "") const;

private:
    std::filesystem::path path_;
};

// Non-blocking pipe standing in for an evdev node.
struct Pipe {
    Pipe();

    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

// Append one raw input_event record.
void writeEvent(int fd, std::uint16_t type, std::uint16_t code, std::int32_t value);

// EV_KEY press (value 1) followed by EV_SYN, as a keyboard reports it.
void writePress(int fd, std::uint16_t code);

// KeyDevice over the read end of `pipe` (takes ownership of it).
Evdev::KeyDevice makeKeyDevice(Pipe& pipe, std::set<Evdev::KeyCode> filter);

std::string readFile(const std::filesystem::path& path);

} // namespace testing_support
