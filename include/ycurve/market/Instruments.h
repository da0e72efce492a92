#ifndef YCURVE_INSTRUMENTS_H
#define YCURVE_INSTRUMENTS_H

#include <string>

// Market inputs for curve construction; transient call parameters, never stored by a curve

// Coupon bond quote; coupon is an annual rate (0.05 for 5%), frequency is payments per year
struct BondRecord {
    double maturity = 0.0;
    double coupon = 0.0;
    double price = 0.0;
    int frequency = 2;
    double faceValue = 100.0;
};

// Money-market deposit quote
struct DepositRecord {
    double maturity = 0.0;
    double rate = 0.0;
};

// Point of an index curve before the index is attached
struct RatePoint {
    double tenor = 0.0;
    double rate = 0.0;
};

// Index fixing, e.g. {"SOFR", 0.25, 0.053}
struct IndexObservation {
    std::string index;
    double tenor = 0.0;
    double rate = 0.0;
};

#endif //YCURVE_INSTRUMENTS_H
