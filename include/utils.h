#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>
#include <cstdint>

std::vector<std::string> split_csv_line(const std::string& line);
std::string trim_copy(const std::string& s);
std::vector<std::string> split_tags(const std::string& field, char sep);

bool parse_int_field(const std::string& field, int64_t& out);
// non-negative and representable as int
bool parse_id_field(const std::string& field, int& out);
bool parse_double_field(const std::string& field, double& out);

int find_column(const std::vector<std::string>& header, const std::string& name);

#endif
