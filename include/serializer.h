#ifndef SERIALIZER_H
#define SERIALIZER_H

#include <string>
#include <vector>
#include <ostream>
#include "item.h"

std::string json_escape(const std::string& s);
void write_json_number(std::ostream& os, double v);
void write_recommendation_json(const Recommendation& r, std::ostream& os);
void write_recommendations_json(const std::vector<Recommendation>& recs, std::ostream& os);
std::string recommendations_to_json(const std::vector<Recommendation>& recs);
std::string error_json(const std::string& msg);

#endif
