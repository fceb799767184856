#include "obstacle_avoidance/obstacle_avoidance_node.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace {

std::size_t to_count(int64_t value, const char *name)
{
  if (value < 0) {
    throw std::invalid_argument(std::string(name) + " must not be negative");
  }
  return static_cast<std::size_t>(value);
}

}  // namespace

ObstacleAvoidanceNode::ObstacleAvoidanceNode(const rclcpp::NodeOptions &options)
: Node("obstacle_avoidance_node", options)
{
  const ControlLoop::Params params = load_params();
  const double period = this->declare_parameter<double>("control_period", cfg::CONTROL_PERIOD);
  if (!(period > 0.0)) {
    throw std::invalid_argument("control_period must be positive");
  }
  const auto scan_topic  = this->declare_parameter<std::string>("scan_topic", "scan");
  const auto cmd_topic   = this->declare_parameter<std::string>("cmd_vel_topic", "cmd_vel");
  const auto state_topic = this->declare_parameter<std::string>("state_topic", "avoidance_state");

  loop_ = std::make_unique<ControlLoop>(params, this->now().seconds());

  // Scan ingestion and the control tick may run concurrently
  scan_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  control_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

  rclcpp::SubscriptionOptions scan_options;
  scan_options.callback_group = scan_group_;

  // LiDAR subscription
  scan_sub_ = this->create_subscription<sensor_msgs::msg::LaserScan>(
    scan_topic, rclcpp::SensorDataQoS(),
    std::bind(&ObstacleAvoidanceNode::scan_callback, this, std::placeholders::_1),
    scan_options);

  // Output publishers
  auto qos = rclcpp::QoS(rclcpp::KeepLast(10)).reliable();
  cmd_pub_ = this->create_publisher<geometry_msgs::msg::Twist>(cmd_topic, qos);
  state_pub_ = this->create_publisher<std_msgs::msg::String>(state_topic, 10);

  control_timer_ = this->create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(period)),
    std::bind(&ObstacleAvoidanceNode::control_callback, this),
    control_group_);

  RCLCPP_INFO(this->get_logger(),
    "Obstacle avoidance up: max_range=%.2f samples=%zu collision=%.2f caution=%.2f "
    "v_max=%.2f w_max=%.2f delay=%.1fs period=%.4fs",
    params.preprocessor.max_range, params.preprocessor.scan_samples,
    params.policy.collision_distance, params.policy.caution_distance,
    params.limits.max_linear, params.limits.max_angular,
    params.startup_delay, period);
}

ControlLoop::Params ObstacleAvoidanceNode::load_params()
{
  ControlLoop::Params p;

  auto &pre = p.preprocessor;
  pre.max_range          = this->declare_parameter<double>("max_range", cfg::MAX_RANGE);
  pre.scan_samples       = to_count(this->declare_parameter<int64_t>(
    "scan_samples", static_cast<int64_t>(cfg::SCAN_SAMPLES)), "scan_samples");
  pre.front_sector_deg   = this->declare_parameter<double>("front_sector_deg", cfg::FRONT_SECTOR_DEG);
  pre.oblique_sector_deg = this->declare_parameter<double>("oblique_sector_deg", cfg::OBLIQUE_SECTOR_DEG);
  pre.side_sector_deg    = this->declare_parameter<double>("side_sector_deg", cfg::SIDE_SECTOR_DEG);
  pre.side_offset_deg    = this->declare_parameter<double>("side_offset_deg", cfg::SIDE_OFFSET_DEG);

  auto &pol = p.policy;
  pol.collision_distance      = this->declare_parameter<double>("collision_distance", cfg::COLLISION_DISTANCE);
  pol.caution_distance        = this->declare_parameter<double>("caution_distance", cfg::CAUTION_DISTANCE);
  pol.crawl_speed             = this->declare_parameter<double>("crawl_speed", cfg::CRAWL_SPEED);
  pol.cruise_speed            = this->declare_parameter<double>("cruise_speed", cfg::CRUISE_SPEED);
  pol.collision_steering_gain = this->declare_parameter<double>(
    "collision_steering_gain", cfg::COLLISION_STEERING_GAIN);

  pol.lateral.kp = this->declare_parameter<double>("lateral.kp", cfg::LAT_KP);
  pol.lateral.ki = this->declare_parameter<double>("lateral.ki", cfg::LAT_KI);
  pol.lateral.kd = this->declare_parameter<double>("lateral.kd", cfg::LAT_KD);
  pol.lateral.window = to_count(this->declare_parameter<int64_t>(
    "lateral.window", static_cast<int64_t>(cfg::LAT_WINDOW)), "lateral.window");

  pol.longitudinal.kp = this->declare_parameter<double>("longitudinal.kp", cfg::LON_KP);
  pol.longitudinal.ki = this->declare_parameter<double>("longitudinal.ki", cfg::LON_KI);
  pol.longitudinal.kd = this->declare_parameter<double>("longitudinal.kd", cfg::LON_KD);
  pol.longitudinal.window = to_count(this->declare_parameter<int64_t>(
    "longitudinal.window", static_cast<int64_t>(cfg::LON_WINDOW)), "longitudinal.window");

  p.limits.max_linear  = this->declare_parameter<double>("max_linear_vel", cfg::MAX_LINEAR_VEL);
  p.limits.max_angular = this->declare_parameter<double>("max_angular_vel", cfg::MAX_ANGULAR_VEL);

  p.startup_delay = this->declare_parameter<double>("startup_delay", cfg::STARTUP_DELAY);
  return p;
}

void ObstacleAvoidanceNode::scan_callback(const sensor_msgs::msg::LaserScan::SharedPtr msg)
{
  loop_->update_scan(std::make_shared<const RangeScan>(msg->ranges));
}

void ObstacleAvoidanceNode::publish_state(const char *state)
{
  std_msgs::msg::String state_msg;
  state_msg.data = state;
  state_pub_->publish(state_msg);
}

void ObstacleAvoidanceNode::control_callback()
{
  const CycleReport report = loop_->tick(this->now().seconds());

  switch (report.status) {
    case CycleStatus::INITIALIZING:
      RCLCPP_INFO_THROTTLE(this->get_logger(), *this->get_clock(), 1000, "Initializing...");
      publish_state(status_name(report.status));
      return;

    case CycleStatus::INVALID_SCAN:
      RCLCPP_ERROR_THROTTLE(this->get_logger(), *this->get_clock(), 1000,
        "Invalid scan, holding previous command: %s", report.error.c_str());
      publish_state(status_name(report.status));
      break;

    case CycleStatus::COMMAND_ISSUED:
      RCLCPP_INFO_THROTTLE(this->get_logger(), *this->get_clock(), 1000,
        "Distance to closest obstacle is %.4f m", report.clearance.closest);
      publish_state(tier_name(report.tier));
      break;
  }

  if (report.command) {
    cmd_pub_->publish(*report.command);
  }
}

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<ObstacleAvoidanceNode>();
  rclcpp::executors::MultiThreadedExecutor executor;
  executor.add_node(node);
  executor.spin();
  rclcpp::shutdown();
  return 0;
}
