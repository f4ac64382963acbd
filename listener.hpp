#pragma once

#include <functional>
#include <memory>

namespace exptrack {

class transaction_model;

// Notified synchronously after every successful change of a transaction_model.
// The model passed in may be inspected through its const accessors.
struct model_listener
{
	virtual ~model_listener() = default;
	virtual void update(const transaction_model & model) = 0;
};

struct callback_listener : model_listener
{
	using Callback = std::function<void(const transaction_model &)>;
	Callback callback;

	callback_listener(Callback c) : callback(std::move(c)) {}

	void update(const transaction_model & model) override
	{
		if (callback)
			callback(model);
	}
};

inline std::shared_ptr<callback_listener> make_listener(callback_listener::Callback c)
{
	return std::make_shared<callback_listener>(std::move(c));
}

} // namespace
