
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "synchronized.hpp"
#include "transaction_model.hpp"

using shared_model = exptrack::synchronized<exptrack::transaction_model, boost::fibers::mutex>;

// Positions of the transactions in the given category. This is the caller's
// business, the model only stores the result.
std::vector<int> match_category(const std::vector<exptrack::transaction_ptr> & transactions, const std::string & category)
{
	std::vector<int> result;
	for (int i=0 ; i<(int)transactions.size() ; i++)
		if (transactions[i]->category == category)
			result.push_back(i);
	return result;
}

void feed(shared_model & model, const exptrack::config & conf, size_t feeder)
{
	exptrack::fiber_local_logger(conf.log_prefix + "-feeder-" + std::to_string(feeder));
	for (size_t i=feeder ; i<conf.transactions.size() ; i+=conf.feeders)
	{
		const auto & seed = conf.transactions[i];
		model->add_transaction(exptrack::make_transaction(seed.amount, seed.category));
		boost::this_fiber::yield();
	}
}

int main(int argc, char ** argv)
{
	exptrack::default_logger(std::cout);

	exptrack::config conf;
	std::string filename = argc > 1 ? argv[1] : "exptrack.conf";
	bool loaded = conf.load(filename);
	exptrack::default_logger().set_level(conf.log_level);

	exptrack::fiber_local_logger(conf.log_prefix);
	exptrack::must_have() << "Startup" << std::endl;
	if ( ! loaded)
		exptrack::warning() << "Could not read " << filename << ", using defaults" << std::endl;

	try {
		shared_model model;

		model->register_listener(exptrack::make_listener([](const exptrack::transaction_model & m)
			{
				exptrack::info() << "model changed: " << m.size() << " transactions, "
				                 << m.get_matched_filter_indices().size() << " matched" << std::endl;
			}));

		std::vector<boost::fibers::fiber> feeders;
		for (size_t f=0 ; f<conf.feeders ; f++)
			feeders.emplace_back([&model, &conf, f]() { feed(model, conf, f); });
		for (auto & fiber : feeders)
			fiber.join();

		{
			auto m = model.lock();
			auto transactions = m->get_transactions();
			for (const auto & t : transactions)
				exptrack::debug() << "  " << *t << std::endl;

			if ( ! conf.filter_category.empty())
				m->set_matched_filter_indices(match_category(transactions, conf.filter_category));

			if ( ! transactions.empty())
				m->remove_transaction(transactions.front());
		}

		exptrack::must_have() << "Stopped gracefully" << std::endl;
	} catch (const std::exception & e) {
		exptrack::fatal() << e.what() << std::endl;
		exptrack::print_trace(std::cerr, e);
		exptrack::fiber_local_logger().flush();
		return 1;
	}
	exptrack::fiber_local_logger().flush();
	return 0;
}
