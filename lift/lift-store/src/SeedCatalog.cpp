// Ticket: 0006_seed_catalog

#include "lift-store/src/SeedCatalog.hpp"

namespace lift_store
{

namespace
{

using lift_metrics::ExerciseType;

NewDefinition entry(const char* name,
                    const char* category,
                    ExerciseType type,
                    const char* unit,
                    const char* description)
{
  return NewDefinition{name, category, type, unit, std::string{description}};
}

}  // namespace

const std::vector<NewDefinition>& defaultCatalog()
{
  static const std::vector<NewDefinition> catalog{
    // Chest
    entry("Barbell Bench Press", "Chest", ExerciseType::WeightReps, "kg",
          "Standard bench press with barbell"),
    entry("Dumbbell Bench Press", "Chest", ExerciseType::WeightReps, "kg",
          "Bench press with dumbbells"),
    entry("Incline Bench Press", "Chest", ExerciseType::WeightReps, "kg",
          "Bench press on an inclined bench"),
    entry("Chest Fly Machine", "Chest", ExerciseType::WeightReps, "kg",
          "Machine chest fly"),
    entry("Push-ups", "Chest", ExerciseType::Reps, "reps",
          "Bodyweight push-ups"),

    // Back
    entry("Barbell Rows", "Back", ExerciseType::WeightReps, "kg",
          "Bent-over barbell rows"),
    entry("Dumbbell Rows", "Back", ExerciseType::WeightReps, "kg",
          "Single-arm dumbbell rows"),
    entry("Pull-ups", "Back", ExerciseType::Reps, "reps",
          "Bodyweight pull-ups"),
    entry("Lat Pulldown", "Back", ExerciseType::WeightReps, "kg",
          "Cable lat pulldown"),
    entry("Deadlifts", "Back", ExerciseType::WeightReps, "kg",
          "Conventional barbell deadlift"),

    // Shoulders
    entry("Overhead Press", "Shoulders", ExerciseType::WeightReps, "kg",
          "Standing barbell overhead press"),
    entry("Dumbbell Shoulder Press", "Shoulders", ExerciseType::WeightReps, "kg",
          "Seated dumbbell press"),
    entry("Lateral Raises", "Shoulders", ExerciseType::WeightReps, "kg",
          "Dumbbell lateral raises"),
    entry("Face Pulls", "Shoulders", ExerciseType::WeightReps, "kg",
          "Cable face pulls"),

    // Legs
    entry("Barbell Squat", "Legs", ExerciseType::WeightReps, "kg",
          "Back squat with barbell"),
    entry("Leg Press", "Legs", ExerciseType::WeightReps, "kg",
          "Machine leg press"),
    entry("Leg Curl", "Legs", ExerciseType::WeightReps, "kg",
          "Machine hamstring curl"),
    entry("Leg Extension", "Legs", ExerciseType::WeightReps, "kg",
          "Machine quad extension"),
    entry("Lunges", "Legs", ExerciseType::WeightReps, "kg",
          "Walking lunges with dumbbells"),
    entry("Sled Push", "Legs", ExerciseType::WeightDistance, "kg",
          "Loaded sled pushed over a distance"),
    entry("Wall Sits", "Legs", ExerciseType::TimeDuration, "seconds",
          "Isometric wall sit"),

    // Arms
    entry("Barbell Curl", "Arms", ExerciseType::WeightReps, "kg",
          "Standing barbell curl"),
    entry("Dumbbell Curl", "Arms", ExerciseType::WeightReps, "kg",
          "Alternating dumbbell curl"),
    entry("Hammer Curls", "Arms", ExerciseType::WeightReps, "kg",
          "Neutral-grip dumbbell curl"),
    entry("Tricep Dips", "Arms", ExerciseType::Reps, "reps",
          "Bodyweight dips"),
    entry("Tricep Pushdown", "Arms", ExerciseType::WeightReps, "kg",
          "Cable tricep pushdown"),

    // Core
    entry("Plank", "Core", ExerciseType::TimeDuration, "seconds",
          "Front plank hold"),
    entry("Weighted Plank", "Core", ExerciseType::WeightTime, "kg",
          "Plank hold with a plate on the back"),
    entry("Hanging Leg Raises", "Core", ExerciseType::Reps, "reps",
          "Leg raises from a pull-up bar"),

    // Strength
    entry("Farmer's Carry", "Strength", ExerciseType::WeightDistance, "kg",
          "Loaded carry over a distance"),
    entry("Dead Hang", "Strength", ExerciseType::WeightTime, "kg",
          "Bar hang, optionally weighted"),
    entry("Max Single", "Strength", ExerciseType::Weight, "kg",
          "Heaviest single lift of the day"),

    // Cardio
    entry("Running", "Cardio", ExerciseType::DistanceTime, "km",
          "Outdoor or treadmill run"),
    entry("Cycling", "Cardio", ExerciseType::DistanceTime, "km",
          "Road or stationary bike"),
    entry("Rowing", "Cardio", ExerciseType::DistanceTime, "km",
          "Rowing machine"),
    entry("Walking", "Cardio", ExerciseType::Distance, "km",
          "Distance walked"),
    entry("Jump Rope", "Cardio", ExerciseType::RepsTime, "reps",
          "Skips counted over a timed round"),
    entry("Burpees", "Cardio", ExerciseType::RepsTime, "reps",
          "Burpees counted over a timed round"),
    entry("Sprints", "Cardio", ExerciseType::TimeSpeed, "seconds",
          "Timed sprint over a fixed distance"),
    entry("Shuttle Runs", "Cardio", ExerciseType::RepsDistance, "reps",
          "Repeated runs over a fixed distance"),

    // Stretching
    entry("Hamstring Stretch", "Stretching", ExerciseType::TimeDuration,
          "seconds", "Seated hamstring stretch"),
    entry("Hip Flexor Stretch", "Stretching", ExerciseType::TimeDuration,
          "seconds", "Kneeling hip flexor stretch"),
  };
  return catalog;
}

}  // namespace lift_store
