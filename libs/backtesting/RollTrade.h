// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLL_TRADE_H
#define __ROLLSIM_ROLL_TRADE_H 1

#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace rollsim
{
  enum class RollTradeKind
    {
      Rollover,
      Compounding,
      BlockedRollover
    };

  inline std::string rollTradeKindToString (RollTradeKind kind)
  {
    switch (kind)
      {
      case RollTradeKind::Rollover:
	return "Rollover";
      case RollTradeKind::Compounding:
	return "Compounding";
      case RollTradeKind::BlockedRollover:
	return "BlockedRollover";
      }
    return "Unknown";
  }

  /**
   * @class RollTrade
   * @brief One entry of the trade ledger.
   *
   * Rollovers carry both prices and the realized P&L. A compounding event
   * only records the new lot count. A blocked rollover keeps the reference
   * prices it would have traded at but realizes nothing.
   */
  template <class Decimal>
  class RollTrade
  {
  public:
    static RollTrade<Decimal> createRollover (const boost::gregorian::date& tradeDate,
					      const std::string& description,
					      const Decimal& sellPrice,
					      const Decimal& buyPrice,
					      unsigned int lots,
					      const Decimal& grossPnL,
					      const Decimal& cost,
					      const Decimal& netPnL,
					      const Decimal& equitySnapshot)
    {
      return RollTrade<Decimal> (tradeDate, RollTradeKind::Rollover, description,
				 sellPrice, buyPrice, lots, grossPnL, cost, netPnL,
				 equitySnapshot, std::nullopt);
    }

    static RollTrade<Decimal> createCompounding (const boost::gregorian::date& tradeDate,
						 unsigned int newLots,
						 const Decimal& equitySnapshot)
    {
      return RollTrade<Decimal> (tradeDate, RollTradeKind::Compounding, "Position Doubled",
				 std::nullopt, std::nullopt, newLots,
				 std::nullopt, std::nullopt, std::nullopt,
				 equitySnapshot, std::string ("Profit Target Hit"));
    }

    // No P&L is realized and the entry price is kept, so the position is
    // marked from here on at the new near price against the old entry.
    static RollTrade<Decimal> createBlockedRollover (const boost::gregorian::date& tradeDate,
						     const std::string& description,
						     const Decimal& referenceSellPrice,
						     const Decimal& referenceBuyPrice,
						     unsigned int lots,
						     const Decimal& equitySnapshot,
						     const std::string& note)
    {
      return RollTrade<Decimal> (tradeDate, RollTradeKind::BlockedRollover, description,
				 referenceSellPrice, referenceBuyPrice, lots,
				 std::nullopt, std::nullopt, std::nullopt,
				 equitySnapshot, note);
    }

    RollTrade (const RollTrade<Decimal>& rhs) = default;
    RollTrade<Decimal>& operator=(const RollTrade<Decimal>& rhs) = default;
    ~RollTrade() = default;

    const boost::gregorian::date& getDate() const
    {
      return mDate;
    }

    RollTradeKind getKind() const
    {
      return mKind;
    }

    const std::string& getDescription() const
    {
      return mDescription;
    }

    const std::optional<Decimal>& getSellPrice() const
    {
      return mSellPrice;
    }

    const std::optional<Decimal>& getBuyPrice() const
    {
      return mBuyPrice;
    }

    // Lots held through the event; for compounding the lots after doubling
    unsigned int getLots() const
    {
      return mLots;
    }

    const std::optional<Decimal>& getGrossPnL() const
    {
      return mGrossPnL;
    }

    const std::optional<Decimal>& getCost() const
    {
      return mCost;
    }

    const std::optional<Decimal>& getNetPnL() const
    {
      return mNetPnL;
    }

    const Decimal& getEquitySnapshot() const
    {
      return mEquitySnapshot;
    }

    const std::optional<std::string>& getNote() const
    {
      return mNote;
    }

  private:
    RollTrade (const boost::gregorian::date& tradeDate,
	       RollTradeKind kind,
	       const std::string& description,
	       const std::optional<Decimal>& sellPrice,
	       const std::optional<Decimal>& buyPrice,
	       unsigned int lots,
	       const std::optional<Decimal>& grossPnL,
	       const std::optional<Decimal>& cost,
	       const std::optional<Decimal>& netPnL,
	       const Decimal& equitySnapshot,
	       const std::optional<std::string>& note)
      : mDate(tradeDate),
	mKind(kind),
	mDescription(description),
	mSellPrice(sellPrice),
	mBuyPrice(buyPrice),
	mLots(lots),
	mGrossPnL(grossPnL),
	mCost(cost),
	mNetPnL(netPnL),
	mEquitySnapshot(equitySnapshot),
	mNote(note)
    {}

  private:
    boost::gregorian::date mDate;
    RollTradeKind mKind;
    std::string mDescription;
    std::optional<Decimal> mSellPrice;
    std::optional<Decimal> mBuyPrice;
    unsigned int mLots;
    std::optional<Decimal> mGrossPnL;
    std::optional<Decimal> mCost;
    std::optional<Decimal> mNetPnL;
    Decimal mEquitySnapshot;
    std::optional<std::string> mNote;
  };
}

#endif
