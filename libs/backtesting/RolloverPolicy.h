// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLLOVER_POLICY_H
#define __ROLLSIM_ROLLOVER_POLICY_H 1

#include <memory>
#include "RollObservation.h"
#include "BacktestConfiguration.h"

namespace rollsim
{
  enum class RolloverDecision
    {
      None,	// same near contract, keep holding
      Execute,	// roll at the previous day's prices
      Stale	// label changed after the old contract expired, do not trade
    };

  /**
   * @brief Decides whether a change of near contract between two consecutive
   * observations is a tradable rollover.
   */
  template <class Decimal>
  class RolloverPolicy
  {
  public:
    RolloverPolicy()
    {}

    virtual ~RolloverPolicy()
    {}

    virtual RolloverDecision decide (const RollObservation<Decimal>& previous,
				     const RollObservation<Decimal>& current) const = 0;

  protected:
    static bool isNearContractChanged (const RollObservation<Decimal>& previous,
				       const RollObservation<Decimal>& current)
    {
      return previous.getNearContract() != current.getNearContract();
    }
  };

  // Rolls on every label change, whatever the expiry dates say
  template <class Decimal>
  class LabelChangeRolloverPolicy : public RolloverPolicy<Decimal>
  {
  public:
    RolloverDecision decide (const RollObservation<Decimal>& previous,
			     const RollObservation<Decimal>& current) const override
    {
      return RolloverPolicy<Decimal>::isNearContractChanged (previous, current) ?
	RolloverDecision::Execute : RolloverDecision::None;
    }
  };

  /**
   * @brief Rolls on a label change only while the outgoing contract is still alive.
   *
   * A change first seen after the previous contract's recorded expiry means the
   * feed skipped days; the previous prices are then weeks out of date. Without a
   * recorded expiry date the change is accepted.
   */
  template <class Decimal>
  class ExpiryGatedRolloverPolicy : public RolloverPolicy<Decimal>
  {
  public:
    RolloverDecision decide (const RollObservation<Decimal>& previous,
			     const RollObservation<Decimal>& current) const override
    {
      if (!RolloverPolicy<Decimal>::isNearContractChanged (previous, current))
	return RolloverDecision::None;

      const auto& expiry = previous.getNearExpiryDate();
      if (expiry && (current.getDate() > *expiry))
	return RolloverDecision::Stale;

      return RolloverDecision::Execute;
    }
  };

  template <class Decimal>
  std::unique_ptr<RolloverPolicy<Decimal>>
  createRolloverPolicy (const BacktestConfiguration<Decimal>& config)
  {
    if (config.isExpiryGuardEnforced())
      return std::make_unique<ExpiryGatedRolloverPolicy<Decimal>>();

    return std::make_unique<LabelChangeRolloverPolicy<Decimal>>();
  }
}

#endif
