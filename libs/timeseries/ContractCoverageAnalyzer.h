// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_CONTRACT_COVERAGE_ANALYZER_H
#define __ROLLSIM_CONTRACT_COVERAGE_ANALYZER_H 1

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "RollTimeSeries.h"
#include "ContractLabel.h"

namespace rollsim
{
  /**
   * @brief How long one contract served as the near leg of the series.
   */
  class ContractCoverage
  {
  public:
    ContractCoverage (const std::string& label,
		      const TimeSeriesDate& firstDate,
		      const TimeSeriesDate& lastDate,
		      const std::optional<TimeSeriesDate>& expiryDate,
		      bool expiryFromFeed,
		      unsigned long numObservations,
		      std::optional<long> gapDays)
      : mLabel(label),
	mFirstDate(firstDate),
	mLastDate(lastDate),
	mExpiryDate(expiryDate),
	mExpiryFromFeed(expiryFromFeed),
	mNumObservations(numObservations),
	mGapDays(gapDays)
    {}

    const std::string& getLabel() const
    {
      return mLabel;
    }

    const TimeSeriesDate& getFirstDate() const
    {
      return mFirstDate;
    }

    const TimeSeriesDate& getLastDate() const
    {
      return mLastDate;
    }

    const std::optional<TimeSeriesDate>& getExpiryDate() const
    {
      return mExpiryDate;
    }

    // False when the expiry was decoded from the label
    bool isExpiryFromFeed() const
    {
      return mExpiryFromFeed;
    }

    unsigned long getNumObservations() const
    {
      return mNumObservations;
    }

    /**
     * Calendar days between this contract's expiry and the first day its
     * successor is quoted as the near leg, 0 when the successor took over on
     * or before expiry. Empty for the last contract or when no expiry is known.
     */
    const std::optional<long>& getGapDays() const
    {
      return mGapDays;
    }

    bool hasGap() const
    {
      return mGapDays && (*mGapDays > 0);
    }

    /**
     * A gap against the expiry date of the contract's last observation. Only
     * these are blocked by the expiry guard; a gap against a label derived
     * expiry is still rolled.
     */
    bool isStaleRollover() const
    {
      return hasGap() && mExpiryFromFeed;
    }

  private:
    std::string mLabel;
    TimeSeriesDate mFirstDate;
    TimeSeriesDate mLastDate;
    std::optional<TimeSeriesDate> mExpiryDate;
    bool mExpiryFromFeed;
    unsigned long mNumObservations;
    std::optional<long> mGapDays;
  };

  //
  // class ContractCoverageAnalyzer
  //
  // Walks a series once and groups consecutive days by near contract. The
  // expiry of a contract is the feed expiry of its last observation when
  // present and is decoded from the label otherwise.
  //

  template <class Decimal>
  class ContractCoverageAnalyzer
  {
  public:
    explicit ContractCoverageAnalyzer (const RollTimeSeries<Decimal>& series)
      : mCoverage(analyze (series))
    {}

    const std::vector<ContractCoverage>& getCoverage() const
    {
      return mCoverage;
    }

    unsigned long getNumContracts() const
    {
      return mCoverage.size();
    }

    unsigned long getNumGaps() const
    {
      unsigned long gaps = 0;
      for (const auto& c : mCoverage)
	if (c.hasGap())
	  gaps++;

      return gaps;
    }

    unsigned long getNumStaleRollovers() const
    {
      unsigned long stale = 0;
      for (const auto& c : mCoverage)
	if (c.isStaleRollover())
	  stale++;

      return stale;
    }

    void writeReport (std::ostream& out) const
    {
      out << std::left
	  << std::setw(12) << "Contract"
	  << std::setw(12) << "First"
	  << std::setw(12) << "Last"
	  << std::setw(12) << "Expiry"
	  << std::setw(8) << "Days"
	  << "Gap" << std::endl;

      for (const auto& c : mCoverage)
	{
	  std::string expiry ("-");
	  if (c.getExpiryDate())
	    expiry = toIsoString (*c.getExpiryDate()) + (c.isExpiryFromFeed() ? "" : "*");

	  out << std::setw(12) << c.getLabel()
	      << std::setw(12) << toIsoString (c.getFirstDate())
	      << std::setw(12) << toIsoString (c.getLastDate())
	      << std::setw(12) << expiry
	      << std::setw(8) << c.getNumObservations();

	  if (c.getGapDays())
	    {
	      out << *c.getGapDays();
	      if (c.isStaleRollover())
		out << "  <-- data gap, stale rollover";
	      else if (c.hasGap())
		out << "  <-- data gap, rolled (no feed expiry)";
	    }
	  else
	    out << "-";

	  out << std::endl;
	}

      out << "* expiry decoded from the contract label" << std::endl;
      out << std::right;
    }

  private:
    struct Run
    {
      std::string label;
      TimeSeriesDate first;
      TimeSeriesDate last;
      // Feed expiry of the last observation, the one the rollover guard checks
      std::optional<TimeSeriesDate> feedExpiry;
      unsigned long count;
    };

    static std::optional<TimeSeriesDate> labelExpiry (const std::string& label)
    {
      try
	{
	  return ContractLabel (label).getExpiryDate();
	}
      catch (const ContractLabelException&)
	{
	  return std::nullopt;
	}
    }

    static std::vector<ContractCoverage> analyze (const RollTimeSeries<Decimal>& series)
    {
      std::vector<Run> runs;

      for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); it++)
	{
	  if (runs.empty() || runs.back().label != it->getNearContract())
	    runs.push_back (Run { it->getNearContract(), it->getDate(), it->getDate(),
				  it->getNearExpiryDate(), 1 });
	  else
	    {
	      Run& current = runs.back();
	      current.last = it->getDate();
	      current.feedExpiry = it->getNearExpiryDate();
	      current.count++;
	    }
	}

      std::vector<ContractCoverage> result;
      result.reserve (runs.size());

      for (std::size_t i = 0; i < runs.size(); i++)
	{
	  const bool fromFeed = runs[i].feedExpiry.has_value();
	  std::optional<TimeSeriesDate> expiry = fromFeed ? runs[i].feedExpiry : labelExpiry (runs[i].label);

	  std::optional<long> gap;
	  if ((i + 1 < runs.size()) && expiry)
	    {
	      long days = daysBetween (*expiry, runs[i + 1].first);
	      gap = (days > 0) ? days : 0;
	    }

	  result.emplace_back (runs[i].label, runs[i].first, runs[i].last,
			       expiry, fromFeed, runs[i].count, gap);
	}

      return result;
    }

  private:
    std::vector<ContractCoverage> mCoverage;
  };
}

#endif
