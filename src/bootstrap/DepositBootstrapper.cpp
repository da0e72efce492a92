#include <ycurve/bootstrap/DepositBootstrapper.h>
#include <ycurve/utils/Errors.h>
#include <algorithm>

CurvePoints DepositBootstrapper::bootstrap(const std::vector<DepositRecord>& deposits) const
{
    if (deposits.empty()) {
        throw ValidationError("DepositBootstrapper: no deposit data provided for bootstrapping");
    }

    std::vector<DepositRecord> sorted(deposits);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const DepositRecord& a, const DepositRecord& b) { return a.maturity < b.maturity; });

    CurvePoints points;
    points.tenors.reserve(sorted.size());
    points.rates.reserve(sorted.size());
    for (const auto& deposit : sorted) {
        if (deposit.maturity <= 0.0) {
            throw ValidationError("DepositBootstrapper: deposit maturity must be positive");
        }
        points.tenors.push_back(deposit.maturity);
        points.rates.push_back(deposit.rate);
    }
    return points;
}
