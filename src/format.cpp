#include "wxrx/records.hpp"

#include <iomanip>
#include <sstream>

namespace wxrx {

std::string format_record(const ElvRecord& rec) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "sensor type: " << rec.sensor_type_name << '\n'
       << "address: " << unsigned(rec.address) << '\n'
       << "temperature: " << rec.temperature << '\n';
    if (rec.humidity) {
        // the Kombi sensor reports whole percent
        if (rec.sensor_type == 7)
            os << "humidity: " << std::setprecision(0) << *rec.humidity << std::setprecision(1) << '\n';
        else
            os << "humidity: " << *rec.humidity << '\n';
    }
    if (rec.wind) os << "wind: " << *rec.wind << '\n';
    if (rec.rain_sum) os << "rain sum: " << *rec.rain_sum << '\n';
    if (rec.rain_detect) os << "rain detector: " << (*rec.rain_detect ? "true" : "false") << '\n';
    if (rec.pressure) os << "pressure: " << *rec.pressure << '\n';
    return os.str();
}

std::string format_record(const MebusRecord& rec) {
    std::ostringstream os;
    os << "id: " << rec.id << '\n'
       << "setkey: " << unsigned(rec.setkey) << '\n'
       << "channel: " << unsigned(rec.channel) + 1 << '\n'
       << "temperature: " << std::fixed << std::setprecision(1) << rec.temperature << '\n'
       << "humidity: " << unsigned(rec.humidity) << '\n';
    return os.str();
}

} // namespace wxrx
