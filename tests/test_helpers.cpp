#include "test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>

namespace fs = std::filesystem;

namespace testing_support {

TempDir::TempDir() {
    std::string tmpl = (fs::temp_directory_path() / "oikos-test-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp");
    }
    path_ = tmpl;
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDir::file(const std::string& name, const std::string& content) const {
    fs::path p = path_ / name;
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
    return p;
}

Pipe::Pipe() {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
}

void writeEvent(int fd, std::uint16_t type, std::uint16_t code, std::int32_t value) {
    struct input_event event{};
    event.type = type;
    event.code = code;
    event.value = value;
    if (::write(fd, &event, sizeof(event)) != static_cast<ssize_t>(sizeof(event))) {
        throw std::system_error(errno, std::generic_category(), "write input_event");
    }
}

void writePress(int fd, std::uint16_t code) {
    writeEvent(fd, EV_KEY, code, 1);
    writeEvent(fd, EV_SYN, SYN_REPORT, 0);
}

Evdev::KeyDevice makeKeyDevice(Pipe& pipe, std::set<Evdev::KeyCode> filter) {
    auto device = Evdev::KeyDevice::create(std::move(pipe.readEnd), std::move(filter), "pipe");
    if (!device) {
        throw std::logic_error("makeKeyDevice needs a non-empty filter");
    }
    return std::move(*device);
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace testing_support
