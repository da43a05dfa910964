#pragma once
/*
 * Formatter
 *
 * Purpose: pluggable text -> text transform applied to a whole buffer.
 * Backends: ProcessFormatter pipes the text through an external command.
 * Registry: one formatter per file extension (no dot, case-insensitive).
 */
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class Formatter {
public:
  virtual ~Formatter() = default;
  // false with msg on failure; out is only written on success
  virtual bool format(std::string_view input, std::string& out, std::string& msg) const = 0;
};

class ProcessFormatter : public Formatter {
public:
  explicit ProcessFormatter(std::vector<std::string> argv);
  bool format(std::string_view input, std::string& out, std::string& msg) const override;
  const std::vector<std::string>& argv() const { return argv_; }
private:
  std::vector<std::string> argv_;
};

class FormatterRegistry {
public:
  void register_formatter(const std::string& ext, std::unique_ptr<Formatter> f);
  const Formatter* find(const std::filesystem::path& path) const;
  const Formatter* find_ext(const std::string& ext) const;
  std::size_t size() const { return map_.size(); }
private:
  std::unordered_map<std::string, std::unique_ptr<Formatter>> map_;
};
