#include "physics/bodies_config.hpp"

#include <sstream>

#include "gtest/gtest.h"
#include "serialization/catalog.pb.h"

namespace orrery {
namespace physics {

class BodiesConfigTest : public ::testing::Test {};

TEST_F(BodiesConfigTest, Default) {
  EXPECT_EQ(BodiesConfig::SmallestBodyType(BodyType::Planet), BodiesConfig());
  EXPECT_NE(BodiesConfig::SmallestBodyType(BodyType::Moon), BodiesConfig());
}

TEST_F(BodiesConfigTest, SmallestBodyType) {
  auto const bodies_config = BodiesConfig::SmallestBodyType(BodyType::Moon);
  EXPECT_TRUE(bodies_config.Selects("sun", BodyType::Star));
  EXPECT_TRUE(bodies_config.Selects("earth", BodyType::Planet));
  EXPECT_TRUE(bodies_config.Selects("pluto", BodyType::DwarfPlanet));
  EXPECT_TRUE(bodies_config.Selects("moon", BodyType::Moon));
  EXPECT_FALSE(bodies_config.Selects("vesta", BodyType::Asteroid));
  EXPECT_FALSE(bodies_config.Selects("halley", BodyType::Comet));
}

TEST_F(BodiesConfigTest, Ids) {
  auto const bodies_config = BodiesConfig::Ids({"earth", "moon"});
  EXPECT_TRUE(bodies_config.Selects("earth", BodyType::Planet));
  EXPECT_TRUE(bodies_config.Selects("moon", BodyType::Moon));
  EXPECT_FALSE(bodies_config.Selects("mars", BodyType::Planet));
  EXPECT_EQ(BodiesConfig::Ids({"moon", "earth", "moon"}), bodies_config);
}

TEST_F(BodiesConfigTest, Serialization) {
  serialization::BodiesConfig message;
  BodiesConfig::Ids({"mars", "earth"}).WriteToMessage(&message);
  ASSERT_TRUE(message.has_ids());
  ASSERT_EQ(2, message.ids().id_size());
  EXPECT_EQ("earth", message.ids().id(0));
  EXPECT_EQ("mars", message.ids().id(1));
  EXPECT_EQ(BodiesConfig::Ids({"earth", "mars"}),
            BodiesConfig::ReadFromMessage(message));

  BodiesConfig::SmallestBodyType(BodyType::DwarfPlanet)
      .WriteToMessage(&message);
  EXPECT_FALSE(message.has_ids());
  EXPECT_EQ(serialization::DWARF_PLANET, message.smallest_body_type());

  message.Clear();
  EXPECT_EQ(BodiesConfig(), BodiesConfig::ReadFromMessage(message));
}

TEST_F(BodiesConfigTest, Output) {
  std::ostringstream out;
  out << BodiesConfig() << " " << BodiesConfig::Ids({"moon", "earth"});
  EXPECT_EQ("SmallestBodyType(Planet) Ids(earth, moon)", out.str());
}

}  // namespace physics
}  // namespace orrery
