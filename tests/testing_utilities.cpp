#include "testing_utilities.h"

#include <dcarchive/common/error.h>
#include <dcarchive/utils/file.h>
#include <spdlog/spdlog.h>

#include <random>

using namespace dcarchive;

namespace dcarchive_test {

TestEnvironment::TestEnvironment() {
    spdlog::set_level(spdlog::level::warn);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    fs::path temp_base = fs::temp_directory_path();
    fs::path test_path =
        temp_base / ("dcarchive_test_" + std::to_string(dis(gen)));

    std::error_code ec;
    if (fs::create_directories(test_path, ec)) {
        test_dir = test_path.string();
    }
}

TestEnvironment::~TestEnvironment() {
    if (!test_dir.empty()) {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
}

const std::string &TestEnvironment::get_dir() const { return test_dir; }
bool TestEnvironment::is_valid() const { return !test_dir.empty(); }

fs::path TestEnvironment::path(const std::string &relative) const {
    return fs::path(test_dir) / relative;
}

fs::path TestEnvironment::write_file(const std::string &relative,
                                     const std::string &content) const {
    fs::path target = path(relative);
    utils::write_file_atomic(target, content);
    return target;
}

std::string TestEnvironment::read_file(const std::string &relative) const {
    auto content = utils::read_file(path(relative));
    return content ? *content : std::string();
}

FaultyObjectStore::FaultyObjectStore(std::shared_ptr<ObjectStore> inner)
    : inner_(std::move(inner)) {}

void FaultyObjectStore::fail_puts_where(Predicate predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    predicate_ = std::move(predicate);
}

void FaultyObjectStore::heal() {
    std::lock_guard<std::mutex> lock(mutex_);
    predicate_ = nullptr;
}

void FaultyObjectStore::check(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (predicate_ && predicate_(key)) {
        ++failures_;
        throw ArchiveError(ArchiveError::STORAGE_ERROR,
                           "Injected failure for " + key);
    }
}

void FaultyObjectStore::put(const std::string &key, const std::string &data) {
    check(key);
    ++puts_;
    inner_->put(key, data);
}

void FaultyObjectStore::put_file(const std::string &key, const fs::path &path) {
    check(key);
    ++puts_;
    inner_->put_file(key, path);
}

std::optional<std::string> FaultyObjectStore::get(const std::string &key) {
    return inner_->get(key);
}

bool FaultyObjectStore::exists(const std::string &key) {
    return inner_->exists(key);
}

std::vector<std::string> FaultyObjectStore::list(const std::string &prefix) {
    return inner_->list(prefix);
}

std::string FaultyObjectStore::describe() const {
    return "faulty+" + inner_->describe();
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace dcarchive_test
