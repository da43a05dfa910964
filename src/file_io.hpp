#pragma once
/*
 * File I/O
 *
 * Purpose: whole-file read (mmap) and whole-file write for the editor buffer.
 * Bytes are taken as-is: no line splitting, no CRLF normalization.
 * Write is safe: write .tmp -> fdatasync -> atomic rename.
 * Both return false with msg on failure and leave the output untouched.
 */
#include <filesystem>
#include <string>
#include <string_view>

bool read_whole_file(const std::filesystem::path& path, std::string& out, std::string& msg);

bool write_whole_file(const std::filesystem::path& path, std::string_view bytes, std::string& msg);
