#include <chrono>
#include <iostream>
#include <string>

#include <tempora.hpp>

using namespace tempora;

// Helper function to print a breakdown as "1 hours 30 minutes"
void printBreakdown(const Breakdown& b, const std::string& label) {
    std::cout << label << ":";
    for (const auto& [unit, amount] : b) {
        std::cout << " " << amount << " " << unit_name(unit);
    }
    std::cout << "\n";
}

int main() {
    std::cout << "tempora Instant Examples\n";
    std::cout << "========================\n\n";

    // Example 1: Creating instants
    std::cout << "1. Creating Instants\n";
    std::cout << "--------------------\n";

    std::cout << "Now: " << Instant::now() << "\n";
    std::cout << "Epoch: " << Instant::epoch_start() << "\n";

    auto halloween = Instant::parse("2020-10-31 19:30 GMT");
    if (!halloween) {
        std::cerr << "parse failed: " << halloween.error().message() << "\n";
        return 1;
    }
    std::cout << "Parsed: " << *halloween << "\n";

    auto from_fields = Instant::from_calendar(CalendarDescriptor{2020, 10, 31, 14, 30, 0, "EST"});
    std::cout << "From calendar fields (EST): " << from_fields.value() << "\n";

    auto bad = Instant::from_calendar(CalendarDescriptor{2021, 2, 29, 0, 0, 0, "GMT"});
    std::cout << "2021-02-29: " << bad.error().message() << " ("
              << error_kind_string(bad.error().kind()) << ")\n\n";

    // Example 2: Durations
    std::cout << "2. Durations\n";
    std::cout << "------------\n";

    auto trip = Duration(Breakdown{{TimeUnit::hours, 1}, {TimeUnit::minutes, 30}});
    std::cout << "Trip: " << trip.as_minutes() << " minutes\n";
    printBreakdown(Duration::from_hours(26).breakdown(), "26 hours");
    printBreakdown(Duration::from_minutes(-90).breakdown({TimeUnit::hours, TimeUnit::minutes}),
                   "-90 minutes");
    printBreakdown(Duration::from_days(1).breakdown({TimeUnit::microfortnights}),
                   "1 day in microfortnights");
    std::cout << "\n";

    // Example 3: Instant arithmetic
    std::cout << "3. Instant Arithmetic\n";
    std::cout << "---------------------\n";

    auto week_later = halloween->add(Duration::from_days(3), Breakdown{{TimeUnit::days, 4}});
    std::cout << "One week later: " << week_later << "\n";
    printBreakdown(halloween->difference(week_later).breakdown({TimeUnit::days, TimeUnit::hours}),
                   "Difference");
    std::cout << "Before? " << std::boolalpha << halloween->is_before(week_later) << "\n\n";

    // Example 4: Waiting
    std::cout << "4. Waiting\n";
    std::cout << "----------\n";

    auto start = std::chrono::steady_clock::now();
    delayed_completion(Duration::from_milliseconds(250)).wait();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "Waited " << waited.count() << " ms for a 250 ms delay\n";

    // Callbacks run on the default timer thread
    auto target = Instant::now().add(Duration(100.0));
    fire_at(target, [target] { std::cout << "Callback fired for " << target << "\n"; });
    delayed_completion(target.add(Duration(50.0))).wait();

    return 0;
}
