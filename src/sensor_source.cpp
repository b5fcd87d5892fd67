#include "sensestream/sensor_source.hpp"
#include "sensestream/log.hpp"
#include "sensestream/time_utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>

namespace sensestream {

namespace {

double round_to(double v, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::round(v * scale) / scale;
}

std::string read_first_line(const std::string &path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

std::string local_ip(const std::string &hostname) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver(ioc);
  boost::system::error_code ec;
  const auto results = resolver.resolve(hostname, "", ec);
  if (ec)
    return "127.0.0.1";
  for (const auto &entry : results) {
    const auto addr = entry.endpoint().address();
    if (addr.is_v4())
      return addr.to_string();
  }
  return "127.0.0.1";
}

// MAC первого не-loopback интерфейса из /sys/class/net
std::string mac_address() {
  const char *base = "/sys/class/net";
  DIR *dir = ::opendir(base);
  if (!dir)
    return "00:00:00:00:00:00";

  std::string mac;
  while (const dirent *ent = ::readdir(dir)) {
    const std::string name = ent->d_name;
    if (name == "." || name == ".." || name == "lo")
      continue;
    const std::string addr =
        read_first_line(std::string(base) + "/" + name + "/address");
    if (!addr.empty() && addr != "00:00:00:00:00:00") {
      mac = addr;
      break;
    }
  }
  ::closedir(dir);
  return mac.empty() ? "00:00:00:00:00:00" : mac;
}

} // namespace

const std::vector<std::string> &required_reading_fields() {
  static const std::vector<std::string> fields{"uuid", "hostname", "ts"};
  return fields;
}

SystemProbe::SystemProbe(std::string root) : root_(std::move(root)) {
  // первая выборка задаёт базу для процента загрузки CPU
  read_cpu_times(prev_idle_, prev_total_);
}

bool SystemProbe::read_cpu_times(std::uint64_t &idle,
                                 std::uint64_t &total) const {
  const std::string line = read_first_line("/proc/stat");
  std::istringstream in(line);
  std::string cpu;
  in >> cpu;
  if (cpu != "cpu")
    return false;

  std::uint64_t v = 0;
  std::uint64_t sum = 0;
  std::uint64_t idle_sum = 0;
  for (int i = 0; in >> v; ++i) {
    sum += v;
    if (i == 3 || i == 4) // idle, iowait
      idle_sum += v;
  }
  idle = idle_sum;
  total = sum;
  return sum > 0;
}

SystemMetrics SystemProbe::sample() {
  SystemMetrics m;

  std::uint64_t idle = 0;
  std::uint64_t total = 0;
  if (read_cpu_times(idle, total) && total > prev_total_) {
    const double dt = static_cast<double>(total - prev_total_);
    const double di = static_cast<double>(idle - prev_idle_);
    m.cpu_percent = 100.0 * (1.0 - di / dt);
    prev_idle_ = idle;
    prev_total_ = total;
  }

  std::ifstream meminfo("/proc/meminfo");
  std::string key;
  std::uint64_t value = 0;
  std::string unit;
  std::uint64_t mem_total = 0;
  std::uint64_t mem_avail = 0;
  while (meminfo >> key >> value >> unit) {
    if (key == "MemTotal:")
      mem_total = value;
    else if (key == "MemAvailable:")
      mem_avail = value;
  }
  if (mem_total > 0)
    m.memory_percent =
        100.0 * static_cast<double>(mem_total - mem_avail) / static_cast<double>(mem_total);

  struct statvfs vfs {};
  if (::statvfs(root_.c_str(), &vfs) == 0) {
    const double used = static_cast<double>(vfs.f_blocks - vfs.f_bfree) *
                        static_cast<double>(vfs.f_frsize);
    m.disk_usage_mb = used / (1024.0 * 1024.0);
  }

  const std::string temp = read_first_line("/sys/class/thermal/thermal_zone0/temp");
  if (!temp.empty()) {
    char *end = nullptr;
    const long milli = std::strtol(temp.c_str(), &end, 10);
    if (end != temp.c_str()) {
      m.cpu_temp_c = static_cast<double>(milli) / 1000.0;
      m.cpu_temp_f = m.cpu_temp_c * 9.0 / 5.0 + 32.0;
    }
  }
  return m;
}

SimulatedSenseHat::SimulatedSenseHat()
    : SimulatedSenseHat(std::random_device{}()) {}

SimulatedSenseHat::SimulatedSenseHat(std::uint64_t seed)
    : rng_(seed), hostname_(boost::asio::ip::host_name()),
      ip_(local_ip(hostname_)), mac_(mac_address()) {
  log_info("SENSOR", "running in SIMULATION mode on " + hostname_ + " (" + ip_ +
                         ", " + mac_ + ")");
}

Record SimulatedSenseHat::read() {
  ++count_;
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
  const std::string compact = format_utc_time(now_t, "%Y%m%d%H%M%S");

  std::normal_distribution<double> temp(22.0, 2.0);
  std::normal_distribution<double> humidity(45.0, 5.0);
  std::normal_distribution<double> pressure(1013.25, 5.0);
  std::uniform_real_distribution<double> tilt(-5.0, 5.0);
  std::uniform_real_distribution<double> heading(0.0, 360.0);
  std::normal_distribution<double> accel_xy(0.0, 0.1);
  std::normal_distribution<double> accel_z(1.0, 0.05);
  std::normal_distribution<double> gyro(0.0, 1.0);
  std::normal_distribution<double> mag_x(20.0, 5.0);
  std::normal_distribution<double> mag_y(-10.0, 5.0);
  std::normal_distribution<double> mag_z(-50.0, 10.0);

  boost::uuids::random_generator gen;
  const SystemMetrics sys = probe_.sample();

  Record r;
  r.set("uuid", "sensehat_" + hostname_ + "_" + compact + "_" +
                    std::to_string(count_));
  r.set("rowid", compact + "_" + boost::uuids::to_string(gen()));
  r.set("hostname", hostname_);
  r.set("ipaddress", ip_);
  r.set("macaddress", mac_);
  r.set("ts", static_cast<std::int64_t>(now_t));
  r.set("datetimestamp", iso8601_utc(now));
  r.set("systemtime", format_utc_time(now_t, "%m/%d/%Y %H:%M:%S"));

  r.set("temperature", round_to(temp(rng_), 2));
  r.set("humidity", round_to(std::clamp(humidity(rng_), 0.0, 100.0), 2));
  r.set("pressure", round_to(pressure(rng_), 2));
  r.set("pitch", round_to(tilt(rng_), 2));
  r.set("roll", round_to(tilt(rng_), 2));
  r.set("yaw", round_to(heading(rng_), 2));
  r.set("accel_x", round_to(accel_xy(rng_), 4));
  r.set("accel_y", round_to(accel_xy(rng_), 4));
  r.set("accel_z", round_to(accel_z(rng_), 4));
  r.set("gyro_x", round_to(gyro(rng_), 4));
  r.set("gyro_y", round_to(gyro(rng_), 4));
  r.set("gyro_z", round_to(gyro(rng_), 4));
  r.set("mag_x", round_to(mag_x(rng_), 4));
  r.set("mag_y", round_to(mag_y(rng_), 4));
  r.set("mag_z", round_to(mag_z(rng_), 4));
  r.set("compass", round_to(heading(rng_), 2));

  r.set("cpu_percent", round_to(sys.cpu_percent, 1));
  r.set("memory_percent", round_to(sys.memory_percent, 1));
  r.set("disk_usage_mb", round_to(sys.disk_usage_mb, 1));
  r.set("cputempc", round_to(sys.cpu_temp_c, 1));
  r.set("cputempf", round_to(sys.cpu_temp_f, 1));
  r.set("simulated", true);
  return r;
}

} // namespace sensestream
