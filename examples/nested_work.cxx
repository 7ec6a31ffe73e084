#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include <pqnest/connection.hxx>
#include <pqnest/coordinator.hxx>

namespace
{
/// Record that an order was placed.  Works both on its own and inside a
/// bigger transaction.
void log_order_event(pqnest::coordinator &co, pqnest::context const &ctx)
{
  co.run_in(ctx, [&co](pqnest::context const &tx) {
    co.active(tx)->exec(
      "INSERT INTO Event(description) VALUES ('order placed')");
  });
}


/// Place an order, logging an event for it.  If the order fails, so does
/// the event.
void place_order(
  pqnest::coordinator &co, pqnest::context const &ctx, int amount)
{
  co.run_in(ctx, [&](pqnest::context const &tx) {
    // An int renders as plain digits, so it's safe to put in the SQL.
    co.active(tx)->exec(
      "INSERT INTO Orders(amount) VALUES (" + std::to_string(amount) + ")");
    log_order_event(co, tx);
    if (amount <= 0)
      throw std::invalid_argument{"Order amount must be positive."};
  });
}
} // namespace


int main()
{
  try
  {
    // (Normally you'd pass connection settings to the connection
    // constructor.)
    pqnest::connection cx;
    pqnest::coordinator co{
      cx, {}, [](pqnest::zview stmt, std::chrono::microseconds elapsed) {
        std::cout << stmt << " (" << elapsed.count() << " us)\n";
      }};

    co.run_in(pqnest::context{}, [&co](pqnest::context const &tx) {
      co.active(tx)->exec(
        "CREATE TEMP TABLE Orders (amount integer) ON COMMIT PRESERVE ROWS");
      co.active(tx)->exec(
        "CREATE TEMP TABLE Event (description varchar) "
        "ON COMMIT PRESERVE ROWS");
    });

    // One transaction.  The bad order rolls back to its savepoint, taking its
    // event along, but the good orders stay.
    co.run_in(pqnest::context{}, [&co](pqnest::context const &tx) {
      place_order(co, tx, 10);
      try
      {
        place_order(co, tx, -1);
      }
      catch (std::invalid_argument const &e)
      {
        std::cerr << "Rejected order: " << e.what() << '\n';
      }
      place_order(co, tx, 20);
    });

    auto const tx{co.start(pqnest::context{})};
    auto const orders{co.active(tx)->exec("SELECT count(*) FROM Orders")};
    auto const events{co.active(tx)->exec("SELECT count(*) FROM Event")};
    std::cout << "Orders: " << orders.at(0, 0) << ", events: "
              << events.at(0, 0) << '\n';
    co.commit(tx);
  }
  catch (pqnest::sql_error const &e)
  {
    std::cerr << "SQL error: " << e.what() << "Query was: " << e.query()
              << '\n';
    return 1;
  }
  catch (std::exception const &e)
  {
    std::cerr << e.what() << '\n';
    return 1;
  }
}
