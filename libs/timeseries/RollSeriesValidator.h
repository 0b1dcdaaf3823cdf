#ifndef __ROLLSIM_ROLL_SERIES_VALIDATOR_H
#define __ROLLSIM_ROLL_SERIES_VALIDATOR_H 1

#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include "RollTimeSeries.h"
#include "ContractLabel.h"
#include "DecimalConstants.h"

namespace rollsim
{
    class RollSeriesValidationException : public std::runtime_error
    {
    public:
        RollSeriesValidationException(const std::string msg)
            : std::runtime_error(msg)
        {}

        ~RollSeriesValidationException()
        {}
    };

    template <class Decimal>
    class RollSeriesValidator
    {
        public:
            explicit RollSeriesValidator(const RollTimeSeries<Decimal>& series,
                                         std::ostream& warningStream = std::cout) :
            mSeries(series),
            mWarningStream(warningStream),
            mNumWarnings(0)
            {}

            // Throws on the first error, returns the number of warnings issued
            unsigned long validate()
            {
                mNumWarnings = 0;

                mValidatePrices();
                mValidateLabels();
                mValidateExpiryDates();
                mValidateTradingDays();

                return mNumWarnings;
            }

        private:
            const RollTimeSeries<Decimal>& mSeries;
            std::ostream& mWarningStream;
            unsigned long mNumWarnings;

            void mWarn(const std::string& message)
            {
                mNumWarnings++;
                mWarningStream << "WARNING: " << message << std::endl;
            }

            void mValidatePrices() // error
            {
                const Decimal zero(DecimalConstants<Decimal>::DecimalZero);

                for(auto it = mSeries.beginSortedAccess(); it != mSeries.endSortedAccess(); it++)
                {
                    if(it->getNearPrice() <= zero)
                        throw RollSeriesValidationException("ERROR: non-positive near price on " + toIsoString(it->getDate()));
                    if(it->getFarPrice() <= zero)
                        throw RollSeriesValidationException("ERROR: non-positive far price on " + toIsoString(it->getDate()));
                }
            }

            void mValidateLabels()
            {
                std::set<std::string> retiredLabels;
                std::string currentLabel;

                for(auto it = mSeries.beginSortedAccess(); it != mSeries.endSortedAccess(); it++)
                {
                    const std::string& nearLabel = it->getNearContract();
                    const std::string dateStr = toIsoString(it->getDate());

                    if(nearLabel == it->getFarContract())
                        mWarn("near and far contract are both " + nearLabel + " on " + dateStr);

                    if(nearLabel != currentLabel)
                    {
                        if(retiredLabels.count(nearLabel) != 0)
                            mWarn("near contract " + nearLabel + " reappears on " + dateStr + " after being rolled out");

                        if(!currentLabel.empty())
                            retiredLabels.insert(currentLabel);
                        currentLabel = nearLabel;
                    }
                }
            }

            void mValidateExpiryDates()
            {
                for(auto it = mSeries.beginSortedAccess(); it != mSeries.endSortedAccess(); it++)
                {
                    const auto& nearExpiry = it->getNearExpiryDate();
                    if(!nearExpiry)
                        continue;

                    const std::string dateStr = toIsoString(it->getDate());

                    if(*nearExpiry < it->getDate())
                        mWarn("near contract " + it->getNearContract() + " expired on " + toIsoString(*nearExpiry)
                              + " but is still quoted on " + dateStr);

                    if(!ContractLabel::labelMatchesDate(it->getNearContract(), *nearExpiry))
                        mWarn("near contract label " + it->getNearContract() + " does not match expiry date "
                              + toIsoString(*nearExpiry) + " on " + dateStr + " (expected "
                              + ContractLabel::formatLabel(*nearExpiry) + ")");
                }
            }

            void mValidateTradingDays()
            {
                for(auto it = mSeries.beginSortedAccess(); it != mSeries.endSortedAccess(); it++)
                    if(isWeekend(it->getDate()))
                        mWarn("observation on a weekend: " + toIsoString(it->getDate()));
            }
    };
}

#endif
