#pragma once

#include <memory>
#include <string>
#include <vector>

#include "errors.hpp"
#include "listener.hpp"
#include "log.hpp"
#include "misc.hpp"
#include "transaction.hpp"

namespace exptrack {

// In-memory list of transactions, the positions an external filter matched in
// it, and the listeners told about every change. Not thread safe: wrap it in a
// synchronized<> to share it.
// The logger copies default_logger()'s outputs and level at construction.
class transaction_model
{
public:
	using listener_ptr = std::shared_ptr<model_listener>;

	transaction_model()
		: log("model", default_logger())
	{}
	transaction_model(const transaction_model &) = delete;
	transaction_model & operator=(const transaction_model &) = delete;

	void add_transaction(transaction_ptr t)
	{
		if ( ! t)
		{
			log << LogLevel::DEBUG << "rejected null transaction" << std::endl;
			throw_invalid_argument("Transaction cannot be null.");
		}
		log << LogLevel::DEBUG << "add " << *t << std::endl;
		transactions.push_back(std::move(t));
		matched_filter_indices.clear();
		state_changed();
	}

	// Removes the first equal transaction, if any. Matched indices are cleared
	// and listeners notified whether or not something was removed.
	void remove_transaction(const transaction_ptr & t)
	{
		auto it = find_pointee(transactions, t);
		if (it != transactions.end())
		{
			log << LogLevel::DEBUG << "remove " << **it << std::endl;
			transactions.erase(it);
		}
		else
			log << LogLevel::DEBUG << "remove: no such transaction" << std::endl;
		matched_filter_indices.clear();
		state_changed();
	}

	std::vector<transaction_ptr> get_transactions() const { return transactions; }
	size_t size() const { return transactions.size(); }
	bool empty() const { return transactions.empty(); }

	// All indices are checked before anything changes.
	void set_matched_filter_indices(std::vector<int> indices)
	{
		for (int index : indices)
		{
			if (index < 0 || index >= (int)transactions.size())
			{
				log << LogLevel::DEBUG << "rejected matched index " << index << ", size is " << transactions.size() << std::endl;
				throw_invalid_argument("Invalid index: " + std::to_string(index));
			}
		}
		log << LogLevel::DEBUG << "matched " << indices.size() << " of " << transactions.size() << std::endl;
		matched_filter_indices = std::move(indices);
		state_changed();
	}
	std::vector<int> get_matched_filter_indices() const { return matched_filter_indices; }

	bool register_listener(listener_ptr listener)
	{
		if ( ! listener || in(listener, listeners))
			return false;
		listeners.push_back(std::move(listener));
		return true;
	}
	size_t number_of_listeners() const { return listeners.size(); }
	bool contains_listener(const listener_ptr & listener) const { return in(listener, listeners); }

protected:
	// Iterates over a copy: listeners registered from within update() are
	// first called on the next change.
	void state_changed()
	{
		std::vector<listener_ptr> current = listeners;
		for (auto & listener : current)
			listener->update(*this);
	}

private:
	std::vector<transaction_ptr> transactions;
	std::vector<int> matched_filter_indices;
	std::vector<listener_ptr> listeners;
	LogWithPrefix log;
};

} // namespace
