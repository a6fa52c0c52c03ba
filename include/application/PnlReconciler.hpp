#pragma once

#include "domain/BrokerStatement.hpp"
#include "domain/Money.hpp"
#include "domain/PnlReconciliation.hpp"
#include "domain/enums/PnlConvention.hpp"
#include "settings/LedgerSettings.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace navledger::application {

/**
 * @brief Сверка дневного P&L двумя независимыми способами
 *
 * Метод A - сумма компонентов выписки (MTM, изменения начислений, комиссии).
 * Метод B - изменение стоимости счёта за вычетом движений капитала.
 * Если оба вычислимы и расходятся больше допуска, в Reporting Error
 * пишется |A - B|, а P&L берётся по методу A.
 */
class PnlReconciler {
public:
    explicit PnlReconciler(std::shared_ptr<settings::LedgerSettings> settings)
        : tolerance_(settings->getPnlTolerance())
        , accrualTolerance_(settings->getAccrualTolerance())
        , convention_(settings->getPnlConvention()) {}

    /**
     * @brief Сверить P&L по выписке
     *
     * @param statement Выписка за день
     * @param previousTotalBroker Total Broker предыдущего дня, если в выписке
     *        нет Starting Value
     */
    domain::PnlReconciliation reconcile(
        const domain::BrokerStatement& statement,
        std::optional<double> previousTotalBroker = std::nullopt
    ) const {
        domain::PnlReconciliation result;
        result.componentSum = componentSum(statement);
        result.navDelta = navDelta(statement, previousTotalBroker);

        if (result.componentSum && result.navDelta) {
            double difference = std::fabs(*result.componentSum - *result.navDelta);
            if (domain::exceedsTolerance(difference, tolerance_)) {
                result.discrepancy = true;
                result.reportingError = difference;
                std::cerr << "[PnlReconciler] WARNING P&L discrepancy"
                          << " date=" << statement.date
                          << " method_a=" << *result.componentSum
                          << " method_b=" << *result.navDelta
                          << " delta=" << difference << std::endl;
            }
            result.pnl = result.componentSum;
        } else if (result.componentSum) {
            result.pnl = result.componentSum;
        } else if (result.navDelta) {
            result.pnl = result.navDelta;
        } else {
            std::cerr << "[PnlReconciler] WARNING P&L not computable"
                      << " date=" << statement.date << std::endl;
        }

        return result;
    }

    /**
     * @brief Проверка согласованности начислений
     *
     * Изменение начислений должно примерно равняться сумме выплаты с
     * обратным знаком. Только предупреждения, на P&L не влияет.
     *
     * @return Имена полей с расхождением ("interest", "dividends")
     */
    std::vector<std::string> checkAccruals(const domain::BrokerStatement& statement) const {
        std::vector<std::string> flagged;
        if (accrualMismatch(statement.interest, statement.changeInInterestAccruals)) {
            flagged.push_back("interest");
            std::cerr << "[PnlReconciler] WARNING accrual discrepancy date=" << statement.date
                      << " field=interest amount=" << *statement.interest
                      << " accrual_change=" << *statement.changeInInterestAccruals << std::endl;
        }
        if (accrualMismatch(statement.dividends, statement.changeInDividendAccruals)) {
            flagged.push_back("dividends");
            std::cerr << "[PnlReconciler] WARNING accrual discrepancy date=" << statement.date
                      << " field=dividends amount=" << *statement.dividends
                      << " accrual_change=" << *statement.changeInDividendAccruals << std::endl;
        }
        return flagged;
    }

    domain::PnlConvention getConvention() const { return convention_; }

private:
    std::optional<double> componentSum(const domain::BrokerStatement& s) const {
        std::vector<std::optional<double>> parts = {
            s.markToMarket, s.changeInInterestAccruals, s.changeInDividendAccruals, s.commissions
        };
        if (convention_ == domain::PnlConvention::INCLUDE_INTEREST_DIVIDENDS) {
            parts.push_back(s.interest);
            parts.push_back(s.dividends);
        }

        bool any = false;
        double sum = 0.0;
        for (const auto& part : parts) {
            if (part) {
                any = true;
                sum += *part;
            }
        }
        if (!any) {
            return std::nullopt;
        }
        return sum;
    }

    std::optional<double> navDelta(const domain::BrokerStatement& s,
                                   std::optional<double> previousTotalBroker) const {
        auto starting = s.startingValue ? s.startingValue : previousTotalBroker;
        if (!s.endingValue || !starting) {
            return std::nullopt;
        }

        double delta = *s.endingValue - *starting - s.depositsWithdrawals.value_or(0.0);
        if (convention_ == domain::PnlConvention::EXCLUDE_INTEREST_DIVIDENDS) {
            delta -= s.interest.value_or(0.0) + s.dividends.value_or(0.0);
        }
        return delta;
    }

    bool accrualMismatch(const std::optional<double>& amount,
                         const std::optional<double>& accrualChange) const {
        if (!amount || !accrualChange || *amount == 0.0 || *accrualChange == 0.0) {
            return false;
        }
        double expected = -*amount;
        return std::fabs(*accrualChange - expected) / std::fabs(*amount) > accrualTolerance_;
    }

    double tolerance_;
    double accrualTolerance_;
    domain::PnlConvention convention_;
};

} // namespace navledger::application
