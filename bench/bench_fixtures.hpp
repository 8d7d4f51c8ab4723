// bench/bench_fixtures.hpp — Synthetic currency inputs sized like the real data file.

#pragma once

#include <cstddef>
#include <string>

namespace curdata_bench {

// Every country AA..ZZ whose letters are both below 'N' gets a simple currency
// "<country>X"; a handful share special cases.
inline std::string synthetic_properties() {
    std::string all;
    std::string countries;
    int numeric = 1;
    for (char first = 'A'; first < 'N'; ++first) {
        for (char second = 'A'; second < 'N'; ++second) {
            const std::string code{first, second, 'X'};
            if (!all.empty()) {
                all += '-';
            }
            char digits[4];
            digits[0] = static_cast<char>('0' + numeric / 100);
            digits[1] = static_cast<char>('0' + (numeric / 10) % 10);
            digits[2] = static_cast<char>('0' + numeric % 10);
            digits[3] = '\0';
            all += code + digits;
            numeric = numeric % 999 + 1;
            countries += std::string{first, second} + "=" + code + "\n";
        }
    }
    all += "-EUR978-USD840-USN997-XAU959";
    std::string special;
    for (char second = 'A'; second < 'K'; ++second) {
        special += std::string{'Q', second} + "=EUR\n";
    }
    special += "US=USD\nUM=USD\nSV=USD;2001-01-01-00-00-00;USN\n";
    return "formatVersion=3\n"
           "dataVersion=1\n"
           "all=" + all + "\n"
           "minor0=AAXBBX\n"
           "minor1=\n"
           "minor3=CCX\n"
           "minorUndefined=XAU\n" + countries + special;
}

} // namespace curdata_bench
