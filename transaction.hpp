#pragma once

#include <memory>
#include <string>
#include <utility>

namespace exptrack {

struct transaction
{
	double amount = 0;
	std::string category;

	transaction() = default;
	transaction(double amount_, std::string category_)
		: amount(amount_)
		, category(std::move(category_))
	{}
};

using transaction_ptr = std::shared_ptr<const transaction>;

inline transaction_ptr make_transaction(double amount, std::string category)
{
	return std::make_shared<const transaction>(amount, std::move(category));
}

inline bool operator==(const transaction & left, const transaction & right)
{
	return left.amount == right.amount && left.category == right.category;
}

template<typename O>
O & operator<<(O & out, const transaction & t)
{
	return out << t.amount << " " << t.category;
}

} // namespace
