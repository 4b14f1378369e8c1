#ifndef COLUMN_STATS_H
#define COLUMN_STATS_H

#include <string>
#include <vector>
#include <unordered_map>

using namespace std;

// column name -> (mean, scale); population variance, zero variance gives scale 1
unordered_map<string, pair<double,double>> compute_column_normalizers(
    const unordered_map<string, vector<double>>& columns
);

double standardize(double v, const pair<double,double>& norm);

double mean_of(const vector<double>& v);
double stddev_of(const vector<double>& v, double mu);
double median_of(vector<double> v);

#endif
