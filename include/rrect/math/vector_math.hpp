/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for the collider pipeline
 *
 * This file provides the geometric primitives used by integration,
 * broad phase and narrow phase:
 * - Vector class for displacements, forces and sizes
 * - Position class for point locations in simulation space
 * - Component-wise helpers (abs, signum, product) used by the
 *   rounded-rectangle overlap test
 */

#pragma once

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Sign of a value with signum(0) == +1
 *
 * Positive zero maps to +1 and negative zero to -1, so coincident bodies
 * still get a push direction.
 */
double signum(double v);

/**
 * @brief Represents a 2D point in simulation space
 *
 * Position is the authoritative location of a body. It is never the
 * render-space translation (see Components::RenderPose).
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& v) const;
    Position operator-(const Vector& v) const;

    /** @brief Displacement from b to this position */
    Vector operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /** @brief Vector with both components set to v */
    static Vector splat(double v);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Component-wise product */
    Vector operator*(const Vector& b) const;

    /** @brief Component-wise sum with a scalar added to both axes */
    Vector operator+(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude (no sqrt) */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /** @brief Component-wise absolute value */
    Vector abs() const;

    /** @brief Component-wise signum, see ::signum */
    Vector signum() const;

    /**
     * @brief Limits the magnitude to maxLength, keeping the direction
     * @param maxLength Largest allowed length
     * @return This vector if already short enough, otherwise a rescaled copy
     */
    Vector clampLength(double maxLength) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(const Vector& v);

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;
};

Vector operator*(double scalar, const Vector& v);
