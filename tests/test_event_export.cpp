#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tidewater/core/events.h"
#include "tidewater/util/event_export.h"
#include "tidewater/util/json.h"

#define TW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

} // namespace

int test_event_export() {
  using namespace tidewater;

  EventLog log;
  {
    ConsumptionEvent c;
    c.customer_id = "customer_1";
    c.demand = 100.0;
    c.consumed = 100.0;
    c.inventory_after = 2300.0;
    c.days_of_supply = 2300.0 / 2400.0;
    log.push(1.0, c);
  }
  {
    DeliveryFailedEvent f;
    f.customer_id = "customer_1";
    f.needed = 2500.0;
    log.push(2.0, f);
  }
  {
    ProcessFailedEvent p;
    p.process = "delivery";
    p.ship_id = "ship_1";
    p.customer_id = "customer_2";
    p.error = "No route found from port_main to \"site_x\", giving up";
    log.push(2.5, p);
  }
  {
    ShipArrivedEvent a;
    a.ship_id = "ship_1";
    a.location = "port_main";
    log.push(3.0, a);
  }

  const std::string csv = events_to_csv(log.events());
  const auto rows = lines_of(csv);
  TW_ASSERT(rows.size() == 5);
  TW_ASSERT(rows[0] == "seq,time,type,ship_id,customer_id,location,amount,detail");
  TW_ASSERT(rows[1].rfind("1,1,consumption,,customer_1,,100,", 0) == 0);
  TW_ASSERT(rows[1].find("inventory=2300") != std::string::npos);
  TW_ASSERT(rows[2] == "2,2,delivery_failed,,customer_1,,2500,reason=no_ships_available");
  // Commas and quotes in the error are escaped.
  TW_ASSERT(rows[3] ==
            "3,2.5,process_failed,ship_1,customer_2,,,"
            "\"process=delivery;error=No route found from port_main to \"\"site_x\"\", giving up\"");
  TW_ASSERT(rows[4] == "4,3,ship_arrived,ship_1,,port_main,,");
  TW_ASSERT(csv.back() == '\n');

  TW_ASSERT(events_to_csv({}) == "seq,time,type,ship_id,customer_id,location,amount,detail\n");

  const std::string jsonl = events_to_jsonl(log.events());
  const auto objs = lines_of(jsonl);
  TW_ASSERT(objs.size() == 4);
  const json::Value first = json::parse(objs[0]);
  TW_ASSERT(first.at("type").string_value() == "consumption");
  TW_ASSERT(first.at("seq").int_value() == 1);
  TW_ASSERT(first.at("current_inventory").number_value() == 2300.0);
  const json::Value third = json::parse(objs[2]);
  TW_ASSERT(third.at("type").string_value() == "process_failed");
  TW_ASSERT(third.at("error").string_value() == "No route found from port_main to \"site_x\", giving up");
  const json::Value fourth = json::parse(objs[3]);
  TW_ASSERT(fourth.find("customer_id") == nullptr);

  TW_ASSERT(events_to_jsonl({}).empty());

  return 0;
}
