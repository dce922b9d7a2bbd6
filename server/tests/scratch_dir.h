#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

// Temporary document root, removed with everything in it on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string &tag)
      : path_(std::filesystem::temp_directory_path() / (tag + "_" + RandomSuffix())) {
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  void Write(const std::string &relative, const std::string &content) const {
    const auto target = path_ / relative;
    std::filesystem::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out << content;
  }

  void MakeDir(const std::string &relative) const {
    std::filesystem::create_directories(path_ / relative);
  }

private:
  static std::string RandomSuffix() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(12, '0');
    std::uniform_int_distribution<int> dist(0, 15);
    for (char &ch : out) {
      ch = kHex[dist(rng)];
    }
    return out;
  }

  std::filesystem::path path_;
};
