#pragma once
#include <filesystem>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);

// 128 random bits as hex, behind an optional prefix ("term_3fa9...").
std::string gen_id(const std::string& prefix = {});

std::string sha1_hex(const std::string& data);
std::string trim(const std::string& s);

// Whitespace split honouring single and double quotes; no other shell syntax.
std::vector<std::string> split_command(const std::string& command);

// Last max_lines lines of a text file; empty if the file cannot be read.
std::string tail_lines(const std::filesystem::path& p, int max_lines);
