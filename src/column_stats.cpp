#include "column_stats.h"
#include <algorithm>
#include <cmath>

using namespace std;

double mean_of(const vector<double>& v) {
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (double x : v) s += x;
    return s / (double)v.size();
}

// population deviation, matches the scaler below
double stddev_of(const vector<double>& v, double mu) {
    if (v.empty()) return 0.0;
    double s2 = 0.0;
    for (double x : v) {
        double d = x - mu;
        s2 += d * d;
    }
    return sqrt(s2 / (double)v.size());
}

double median_of(vector<double> v) {
    if (v.empty()) return 0.0;
    sort(v.begin(), v.end());
    size_t n = v.size();
    if (n % 2) return v[n/2];
    return (v[n/2 - 1] + v[n/2]) / 2.0;
}

unordered_map<string, pair<double,double>> compute_column_normalizers(
    const unordered_map<string, vector<double>>& columns
) {
    unordered_map<string, pair<double,double>> out;
    for (auto& kv : columns) {
        const vector<double>& v = kv.second;
        double mean = mean_of(v);
        double sd = stddev_of(v, mean);
        if (!(sd > 1e-12)) sd = 1.0;
        out[kv.first] = make_pair(mean, sd);
    }
    return out;
}

double standardize(double v, const pair<double,double>& norm) {
    return (v - norm.first) / norm.second;
}
