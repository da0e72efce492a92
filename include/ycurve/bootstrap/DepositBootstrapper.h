#ifndef YCURVE_DEPOSITBOOTSTRAPPER_H
#define YCURVE_DEPOSITBOOTSTRAPPER_H

#include <ycurve/bootstrap/Bootstrapper.h>
#include <ycurve/market/Instruments.h>

// Deposit rates are already spot rates: sort by maturity and pass them through
class DepositBootstrapper : public Bootstrapper<DepositRecord>
{
public:
    std::string name() const override { return "deposit"; }
    CurvePoints bootstrap(const std::vector<DepositRecord>& deposits) const override;
};

#endif //YCURVE_DEPOSITBOOTSTRAPPER_H
