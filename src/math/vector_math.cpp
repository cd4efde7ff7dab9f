#include "rrect/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

double signum(double v) {
  if (std::isnan(v)) {
    return v;
  }
  return std::copysign(1.0, v);
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Position Position::operator-(const Vector& v) const {
  return {this->x - v.x, this->y - v.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
  return (*this - p).length();
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Position& Position::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

bool Position::operator==(const Position& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Position::operator!=(const Position& other) const {
  return !(*this == other);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::splat(double v) {
  return {v, v};
}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

Vector Vector::operator*(const Vector& b) const {
  return {this->x * b.x, this->y * b.y};
}

Vector Vector::operator+(double scalar) const {
  return {this->x + scalar, this->y + scalar};
}

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::abs() const {
  return {std::fabs(this->x), std::fabs(this->y)};
}

Vector Vector::signum() const {
  return {::signum(this->x), ::signum(this->y)};
}

Vector Vector::clampLength(double maxLength) const {
  double const lenSq = this->lengthSquared();
  if (lenSq > maxLength * maxLength && lenSq > 0.0) {
    double const factor = maxLength / std::sqrt(lenSq);
    return {this->x * factor, this->y * factor};
  }
  return *this;
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

Vector& Vector::operator*=(const Vector& v) {
    this->x *= v.x;
    this->y *= v.y;
    return *this;
}

bool Vector::operator==(const Vector& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Vector::operator!=(const Vector& other) const {
  return !(*this == other);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}
