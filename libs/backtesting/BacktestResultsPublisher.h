// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_BACKTEST_RESULTS_PUBLISHER_H
#define __ROLLSIM_BACKTEST_RESULTS_PUBLISHER_H 1

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/thread/mutex.hpp>
#include "BacktestResults.h"

namespace rollsim
{
  class BacktestResultsPublisherException : public std::runtime_error
  {
  public:
    BacktestResultsPublisherException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~BacktestResultsPublisherException()
    {}
  };

  /**
   * @class BacktestResultsPublisher
   * @brief Hands the results of the most recently started run to readers.
   *
   * A caller takes a ticket before starting a run and publishes the outcome
   * with that ticket. Tickets increase monotonically; an outcome whose ticket
   * is not newer than the one already published is dropped, so a slow older
   * run can never overwrite a newer one. Readers receive an immutable,
   * complete results object or nothing.
   *
   * Thread Safety:
   * - All members may be called concurrently.
   */
  template <class Decimal>
  class BacktestResultsPublisher
  {
  public:
    using ResultsPtr = std::shared_ptr<const BacktestResults<Decimal>>;

    BacktestResultsPublisher()
      : mMutex(),
	mLastTicketIssued(0),
	mPublishedTicket(0),
	mLatest()
    {}

    BacktestResultsPublisher (const BacktestResultsPublisher<Decimal>&) = delete;
    BacktestResultsPublisher<Decimal>& operator=(const BacktestResultsPublisher<Decimal>&) = delete;

    unsigned long beginRun()
    {
      boost::mutex::scoped_lock lock(mMutex);
      return ++mLastTicketIssued;
    }

    /**
     * @brief Publish the outcome of the run holding ticket.
     * @param results empty when the run had nothing to show (too little data).
     * @return true if the outcome became the current one.
     * @throws BacktestResultsPublisherException for a ticket never issued.
     */
    bool publish (unsigned long ticket, std::optional<BacktestResults<Decimal>> results)
    {
      ResultsPtr published;
      if (results)
	published = std::make_shared<const BacktestResults<Decimal>> (std::move (*results));

      boost::mutex::scoped_lock lock(mMutex);

      if (ticket == 0 || ticket > mLastTicketIssued)
	throw BacktestResultsPublisherException ("BacktestResultsPublisher::publish - ticket "
						 + std::to_string (ticket) + " was never issued");

      if (ticket <= mPublishedTicket)
	return false;

      mPublishedTicket = ticket;
      mLatest = published;
      return true;
    }

    // Null when nothing has been published or the latest run had no results
    ResultsPtr getLatest() const
    {
      boost::mutex::scoped_lock lock(mMutex);
      return mLatest;
    }

  private:
    mutable boost::mutex mMutex;
    unsigned long mLastTicketIssued;
    unsigned long mPublishedTicket;
    ResultsPtr mLatest;
  };
}

#endif
